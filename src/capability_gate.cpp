#include "capability_gate.hpp"

namespace recdock {

namespace {

// Firmware version numbers at which each feature appeared.
constexpr uint32_t V_FACTORY_RESET           = 327705;
constexpr uint32_t V_SETTINGS                = 327714;
constexpr uint32_t V_FILE_COUNT_OPTIONAL     = 327722;
constexpr uint32_t V_STORAGE_COMMANDS        = 327733;
constexpr uint32_t V_H1_PROMPT_TONE          = 327940;
constexpr uint32_t V_H1_RESTORE_FACTORY      = 327944;
constexpr uint32_t V_H1E_PROMPT_TONE_RESTORE = 393476;

bool is_h1_family(Model m) { return m == Model::H1 || m == Model::H1E; }

bool below(std::optional<uint32_t> version, uint32_t threshold) {
    return version && *version < threshold;
}

} // anonymous namespace

const char* capability_name(Capability c) {
    switch (c) {
        case Capability::FactoryReset:           return "factory-reset";
        case Capability::RestoreFactorySettings: return "restore-factory-settings";
        case Capability::GetSettings:            return "get-settings";
        case Capability::SetSettings:            return "set-settings";
        case Capability::SetBluetoothPromptTone: return "set-bluetooth-prompt-tone";
        case Capability::StorageCommands:        return "storage-commands";
        case Capability::Bluetooth:              return "bluetooth";
    }
    return "unknown";
}

bool is_supported(Capability c, Model model, std::optional<uint32_t> version) {
    switch (c) {
        case Capability::FactoryReset:
            return !(is_h1_family(model) && below(version, V_FACTORY_RESET));
        case Capability::RestoreFactorySettings:
            return !((model == Model::H1E && below(version, V_H1E_PROMPT_TONE_RESTORE)) ||
                     (model == Model::H1 && below(version, V_H1_RESTORE_FACTORY)));
        case Capability::GetSettings:
        case Capability::SetSettings:
            return !(is_h1_family(model) && below(version, V_SETTINGS));
        case Capability::SetBluetoothPromptTone:
            return !((model == Model::H1E && below(version, V_H1E_PROMPT_TONE_RESTORE)) ||
                     (model == Model::H1 && below(version, V_H1_PROMPT_TONE)));
        case Capability::StorageCommands:
            return !(is_h1_family(model) && below(version, V_STORAGE_COMMANDS));
        case Capability::Bluetooth:
            return model == Model::P1;
    }
    return false;
}

bool needs_file_count_prequery(std::optional<uint32_t> version) {
    return !version || *version <= V_FILE_COUNT_OPTIONAL;
}

} // namespace recdock

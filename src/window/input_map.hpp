#pragma once

// =============================================================================
// input_map.hpp — key chord to KeyAssignment lookup
// =============================================================================
// Built from the default bindings plus the `bind = ...` lines of the config;
// a configured chord replaces the default bound to the same chord. Rebuilt
// whenever the configuration is reloaded.
// =============================================================================

#include "../config/config.hpp"

#include <optional>
#include <unordered_map>

namespace termwin
{

    class InputMap
    {
    public:
        InputMap() = default;
        explicit InputMap(const Config &config);

        std::optional<KeyAssignment> lookup(const KeyEvent &event) const;

        std::size_t size() const { return keys_.size(); }

    private:
        std::unordered_map<KeyChord, KeyAssignment, KeyChordHash> keys_;
    };

    std::vector<KeyBinding> default_key_bindings();

} // namespace termwin

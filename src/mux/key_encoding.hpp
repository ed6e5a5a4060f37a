#pragma once

// =============================================================================
// key_encoding.hpp — KeyEvent → terminal byte sequence translation
// =============================================================================

#include "../config/key_assignment.hpp"

#include <string>

namespace termwin
{

    /// Bytes a terminal application expects for `event`: control codes for
    /// Ctrl+letter, CSI sequences for arrows and navigation keys, UTF-8 for
    /// plain characters. Unknown keys encode to an empty string.
    std::string encode_key(const KeyEvent &event);

} // namespace termwin

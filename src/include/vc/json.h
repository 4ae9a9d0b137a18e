#pragma once

#include <string>
#include <vc/input.h>

namespace vc {

// Parse JSON text into an Input: objects become Mapping (document order kept,
// keys as Text), arrays List, integral numbers Int (Float when they do not fit
// in 64 bits), other numbers Float, strings Text, true/false Bool, null Null.
// `//` and `/* */` comments are skipped. Throws std::runtime_error with line
// and column on malformed input.
Input parse_json(const std::string& text);

namespace json_literals {
    inline Input operator"" _json(const char* s, std::size_t len) { return parse_json(std::string(s, len)); }
}  // namespace json_literals

}  // namespace vc

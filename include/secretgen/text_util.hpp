#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace secretgen {

std::string TrimAsciiWhitespace(std::string_view input);

// Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF.
bool IsValidUtf8(std::string_view input);

// Decodes valid UTF-8 into code points. Returns false on malformed input.
bool DecodeUtf8(std::string_view input, std::vector<std::uint32_t>& out_code_points);

}  // namespace secretgen

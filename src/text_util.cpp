#include "secretgen/text_util.hpp"

#include <cctype>
#include <cstddef>

namespace secretgen {

namespace {

// Length of the sequence introduced by lead, or 0 for an invalid lead byte.
std::size_t SequenceLength(const unsigned char lead) {
    if (lead < 0x80U) {
        return 1;
    }
    if (lead >= 0xC2U && lead <= 0xDFU) {
        return 2;
    }
    if (lead >= 0xE0U && lead <= 0xEFU) {
        return 3;
    }
    if (lead >= 0xF0U && lead <= 0xF4U) {
        return 4;
    }
    return 0;
}

bool IsContinuation(const unsigned char byte) {
    return (byte & 0xC0U) == 0x80U;
}

}  // namespace

std::string TrimAsciiWhitespace(const std::string_view input) {
    std::size_t start = 0;
    std::size_t end = input.size();
    while (start < end && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

bool DecodeUtf8(const std::string_view input, std::vector<std::uint32_t>& out_code_points) {
    out_code_points.clear();
    out_code_points.reserve(input.size());

    std::size_t pos = 0;
    while (pos < input.size()) {
        const unsigned char lead = static_cast<unsigned char>(input[pos]);
        const std::size_t len = SequenceLength(lead);
        if (len == 0 || pos + len > input.size()) {
            return false;
        }
        if (len == 1) {
            out_code_points.push_back(lead);
            ++pos;
            continue;
        }

        std::uint32_t cp = 0;
        if (len == 2) {
            cp = lead & 0x1FU;
        } else if (len == 3) {
            cp = lead & 0x0FU;
        } else {
            cp = lead & 0x07U;
        }
        for (std::size_t i = 1; i < len; ++i) {
            const unsigned char next = static_cast<unsigned char>(input[pos + i]);
            if (!IsContinuation(next)) {
                return false;
            }
            cp = (cp << 6U) | static_cast<std::uint32_t>(next & 0x3FU);
        }

        if (len == 3 && (cp < 0x800U || (cp >= 0xD800U && cp <= 0xDFFFU))) {
            return false;
        }
        if (len == 4 && (cp < 0x10000U || cp > 0x10FFFFU)) {
            return false;
        }
        out_code_points.push_back(cp);
        pos += len;
    }
    return true;
}

bool IsValidUtf8(const std::string_view input) {
    std::vector<std::uint32_t> ignored;
    return DecodeUtf8(input, ignored);
}

}  // namespace secretgen

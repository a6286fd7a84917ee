#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "secretgen/gen_status.hpp"
#include "secretgen/random_source.hpp"

namespace secretgen {

constexpr std::size_t kDefaultTokenBytes = 32;
constexpr std::size_t kMaxTokenBytes = 4096;
constexpr std::size_t kUuidByteCount = 16;

enum class TokenEncoding {
    Hex,
    Base64Url,
    Uuid4
};

struct TokenPolicy {
    std::size_t byte_length = kDefaultTokenBytes;
    TokenEncoding encoding = TokenEncoding::Hex;
};

std::string_view ToString(TokenEncoding encoding);

// Accepts hex, b64, base64url, uuid and uuid4 (case-insensitive).
GenStatus ParseTokenEncoding(std::string_view name, TokenEncoding& out_encoding);

class TokenGenerator {
public:
    static GenStatus Generate(const TokenPolicy& policy, IRandomSource& rng, std::string& out_token);

    // Bytes actually drawn for the policy; uuid4 always uses 16.
    static std::size_t RequiredBytes(const TokenPolicy& policy);

    static std::string EncodeHex(const std::vector<std::uint8_t>& bytes);
    static std::string EncodeBase64Url(const std::vector<std::uint8_t>& bytes);
    static std::string FormatUuid4(std::array<std::uint8_t, kUuidByteCount> bytes);
};

}  // namespace secretgen

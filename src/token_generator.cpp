#include "secretgen/token_generator.hpp"

#include <algorithm>
#include <cctype>

#include <cryptopp/algparam.h>
#include <cryptopp/argnames.h>
#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <cryptopp/misc.h>

namespace secretgen {

std::string_view ToString(const TokenEncoding encoding) {
    switch (encoding) {
        case TokenEncoding::Hex:
            return "hex";
        case TokenEncoding::Base64Url:
            return "base64url";
        case TokenEncoding::Uuid4:
            return "uuid4";
    }
    return "unknown";
}

GenStatus ParseTokenEncoding(const std::string_view name, TokenEncoding& out_encoding) {
    std::string normalized(name);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (normalized == "hex") {
        out_encoding = TokenEncoding::Hex;
        return GenStatus::Ok;
    }
    if (normalized == "b64" || normalized == "base64url") {
        out_encoding = TokenEncoding::Base64Url;
        return GenStatus::Ok;
    }
    if (normalized == "uuid" || normalized == "uuid4") {
        out_encoding = TokenEncoding::Uuid4;
        return GenStatus::Ok;
    }
    return GenStatus::UnknownEncoding;
}

std::size_t TokenGenerator::RequiredBytes(const TokenPolicy& policy) {
    if (policy.encoding == TokenEncoding::Uuid4) {
        return kUuidByteCount;
    }
    return policy.byte_length;
}

GenStatus TokenGenerator::Generate(const TokenPolicy& policy, IRandomSource& rng, std::string& out_token) {
    if (policy.encoding != TokenEncoding::Uuid4 &&
        (policy.byte_length == 0 || policy.byte_length > kMaxTokenBytes)) {
        return GenStatus::InvalidLength;
    }

    std::vector<std::uint8_t> bytes(RequiredBytes(policy), 0U);
    const GenStatus random_status = rng.FillBytes(bytes.data(), bytes.size());
    if (random_status != GenStatus::Ok) {
        SecureWipe(bytes);
        return random_status;
    }

    switch (policy.encoding) {
        case TokenEncoding::Hex:
            out_token = EncodeHex(bytes);
            break;
        case TokenEncoding::Base64Url:
            out_token = EncodeBase64Url(bytes);
            break;
        case TokenEncoding::Uuid4: {
            std::array<std::uint8_t, kUuidByteCount> raw{};
            std::copy(bytes.begin(), bytes.end(), raw.begin());
            out_token = FormatUuid4(raw);
            CryptoPP::memset_z(raw.data(), 0, raw.size());
            break;
        }
    }
    SecureWipe(bytes);
    return GenStatus::Ok;
}

std::string TokenGenerator::EncodeHex(const std::vector<std::uint8_t>& bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const std::uint8_t byte : bytes) {
        out.push_back(kHex[(byte >> 4U) & 0x0FU]);
        out.push_back(kHex[byte & 0x0FU]);
    }
    return out;
}

std::string TokenGenerator::EncodeBase64Url(const std::vector<std::uint8_t>& bytes) {
    std::string out;
    CryptoPP::Base64URLEncoder encoder(new CryptoPP::StringSink(out), false);
    const CryptoPP::AlgorithmParameters params =
        CryptoPP::MakeParameters(CryptoPP::Name::Pad(), false)(CryptoPP::Name::InsertLineBreaks(), false);
    encoder.IsolatedInitialize(params);
    encoder.Put(bytes.data(), bytes.size());
    encoder.MessageEnd();
    return out;
}

std::string TokenGenerator::FormatUuid4(std::array<std::uint8_t, kUuidByteCount> bytes) {
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0FU) | 0x40U);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3FU) | 0x80U);

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHex[(bytes[i] >> 4U) & 0x0FU]);
        out.push_back(kHex[bytes[i] & 0x0FU]);
    }
    return out;
}

}  // namespace secretgen

#include "secretgen/random_source.hpp"

#include <limits>
#include <utility>

#include <cryptopp/misc.h>
#include <cryptopp/osrng.h>

namespace secretgen {

GenStatus SecureRandomSource::Create(std::unique_ptr<IRandomSource>& out_source) {
    out_source.reset();
    try {
        auto pool = std::make_unique<CryptoPP::AutoSeededRandomPool>();
        out_source.reset(new SecureRandomSource(std::move(pool)));
    } catch (const CryptoPP::Exception&) {
        return GenStatus::RngFailure;
    }
    return GenStatus::Ok;
}

SecureRandomSource::SecureRandomSource(std::unique_ptr<CryptoPP::AutoSeededRandomPool> pool)
    : pool_(std::move(pool)) {}

SecureRandomSource::~SecureRandomSource() = default;

GenStatus SecureRandomSource::FillBytes(std::uint8_t* out, const std::size_t length) {
    if (length == 0) {
        return GenStatus::Ok;
    }
    if (out == nullptr) {
        return GenStatus::InvalidLength;
    }
    try {
        pool_->GenerateBlock(out, length);
    } catch (const CryptoPP::Exception&) {
        return GenStatus::RngFailure;
    }
    return GenStatus::Ok;
}

GenStatus SecureRandomSource::UniformIndex(const std::size_t bound, std::size_t& out_index) {
    if (bound == 0 || bound - 1 > std::numeric_limits<CryptoPP::word32>::max()) {
        return GenStatus::InvalidLength;
    }
    try {
        // GenerateWord32 rejects out-of-range samples, so the draw is unbiased.
        out_index = static_cast<std::size_t>(
            pool_->GenerateWord32(0, static_cast<CryptoPP::word32>(bound - 1)));
    } catch (const CryptoPP::Exception&) {
        return GenStatus::RngFailure;
    }
    return GenStatus::Ok;
}

void SecureWipe(std::string& value) {
    if (!value.empty()) {
        CryptoPP::memset_z(&value[0], 0, value.size());
    }
    value.clear();
}

void SecureWipe(std::vector<std::uint8_t>& bytes) {
    if (!bytes.empty()) {
        CryptoPP::memset_z(bytes.data(), 0, bytes.size());
    }
    bytes.clear();
}

}  // namespace secretgen

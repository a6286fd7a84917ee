#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "secretgen/gen_status.hpp"

namespace CryptoPP {
class AutoSeededRandomPool;
}

namespace secretgen {

class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    virtual GenStatus FillBytes(std::uint8_t* out, std::size_t length) = 0;

    // Uniform integer in [0, bound). bound must be non-zero.
    virtual GenStatus UniformIndex(std::size_t bound, std::size_t& out_index) = 0;
};

// Operating-system backed CSPRNG. Acquire once per invocation through Create();
// any failure is final for that invocation.
class SecureRandomSource final : public IRandomSource {
public:
    static GenStatus Create(std::unique_ptr<IRandomSource>& out_source);

    ~SecureRandomSource() override;

    GenStatus FillBytes(std::uint8_t* out, std::size_t length) override;
    GenStatus UniformIndex(std::size_t bound, std::size_t& out_index) override;

private:
    explicit SecureRandomSource(std::unique_ptr<CryptoPP::AutoSeededRandomPool> pool);

    std::unique_ptr<CryptoPP::AutoSeededRandomPool> pool_;
};

void SecureWipe(std::string& value);
void SecureWipe(std::vector<std::uint8_t>& bytes);

}  // namespace secretgen

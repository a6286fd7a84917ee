#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "secretgen/gen_status.hpp"
#include "secretgen/json.hpp"
#include "secretgen/strength_model.hpp"

namespace secretgen {

struct EntropyReport {
    std::size_t length = 0;  // code points
    double shannon_bits_estimate = 0.0;
    std::optional<StrengthReport> strength;
};

class EntropyEstimator {
public:
    EntropyEstimator() = default;
    explicit EntropyEstimator(std::unique_ptr<IStrengthModel> strength_model);

    GenStatus Estimate(std::string_view input, EntropyReport& out_report) const;

    // Unrounded H * n over the code point histogram.
    static double ShannonBits(const std::vector<std::uint32_t>& code_points);
    static double RoundToPrecision(double value, int decimals);

private:
    std::unique_ptr<IStrengthModel> strength_model_;
};

// Strength fields appear only when a model ran.
JsonValue ToJson(const EntropyReport& report);

}  // namespace secretgen

#include "secretgen/entropy_estimator.hpp"

#include <cmath>
#include <unordered_map>
#include <utility>

#include "secretgen/text_util.hpp"

namespace secretgen {

EntropyEstimator::EntropyEstimator(std::unique_ptr<IStrengthModel> strength_model)
    : strength_model_(std::move(strength_model)) {}

GenStatus EntropyEstimator::Estimate(const std::string_view input, EntropyReport& out_report) const {
    std::vector<std::uint32_t> code_points;
    if (!DecodeUtf8(input, code_points)) {
        return GenStatus::InvalidEncoding;
    }
    if (code_points.empty()) {
        return GenStatus::EmptyInput;
    }

    EntropyReport report;
    report.length = code_points.size();
    const double estimate = RoundToPrecision(ShannonBits(code_points), 6);
    report.shannon_bits_estimate = estimate == 0.0 ? 0.0 : estimate;

    if (strength_model_ != nullptr) {
        StrengthReport strength;
        const GenStatus status = strength_model_->Assess(input, strength);
        if (status != GenStatus::Ok) {
            return status;
        }
        report.strength = std::move(strength);
    }

    out_report = std::move(report);
    return GenStatus::Ok;
}

double EntropyEstimator::ShannonBits(const std::vector<std::uint32_t>& code_points) {
    if (code_points.empty()) {
        return 0.0;
    }

    std::unordered_map<std::uint32_t, std::size_t> counts;
    for (const std::uint32_t cp : code_points) {
        ++counts[cp];
    }

    const double length = static_cast<double>(code_points.size());
    double sum = 0.0;
    for (const auto& entry : counts) {
        const double probability = static_cast<double>(entry.second) / length;
        sum += probability * std::log2(probability);
    }
    return -sum * length;
}

double EntropyEstimator::RoundToPrecision(const double value, const int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

JsonValue ToJson(const EntropyReport& report) {
    JsonValue out = JsonValue::Object();
    out.Set("length", JsonValue::Integer(static_cast<long long>(report.length)));
    out.Set("shannon_bits_estimate", JsonValue::Number(report.shannon_bits_estimate));
    if (report.strength.has_value()) {
        const StrengthReport& strength = *report.strength;
        out.Set("guesses_log10", JsonValue::Number(strength.guesses_log10));
        out.Set("score", JsonValue::Integer(strength.score));

        JsonValue display = JsonValue::Object();
        const CrackTimesDisplay& times = strength.crack_times_display;
        display.Set("online_throttling_100_per_hour", JsonValue::String(times.online_throttling_100_per_hour));
        display.Set("online_no_throttling_10_per_second", JsonValue::String(times.online_no_throttling_10_per_second));
        display.Set("offline_slow_hashing_1e4_per_second", JsonValue::String(times.offline_slow_hashing_1e4_per_second));
        display.Set("offline_fast_hashing_1e10_per_second", JsonValue::String(times.offline_fast_hashing_1e10_per_second));
        out.Set("crack_times_display", std::move(display));
    }
    return out;
}

}  // namespace secretgen

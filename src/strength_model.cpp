#include "secretgen/strength_model.hpp"

#include <cmath>
#include <memory>
#include <string>

#include <zxcvbn.h>

namespace secretgen {

namespace {

constexpr double kLog10Of2 = 0.301029996;

class ZxcvbnStrengthModel final : public IStrengthModel {
public:
    GenStatus Assess(const std::string_view input, StrengthReport& out_report) const override {
        // The matcher works on NUL-terminated text.
        if (input.find('\0') != std::string_view::npos) {
            return GenStatus::StrengthFailed;
        }
        const std::string text(input);
        const double bits = ZxcvbnMatch(text.c_str(), nullptr, nullptr);
        if (!std::isfinite(bits) || bits < 0.0) {
            return GenStatus::StrengthFailed;
        }

        out_report.guesses_log10 = bits * kLog10Of2;
        out_report.score = ScoreFromGuessesLog10(out_report.guesses_log10);
        out_report.crack_times_display = EstimateCrackTimes(out_report.guesses_log10);
        return GenStatus::Ok;
    }

    std::string_view Name() const override {
        return "zxcvbn";
    }
};

std::string DisplayCrackTimeForRate(const double guesses_log10, const double rate) {
    const double seconds_log10 = guesses_log10 - std::log10(rate);
    if (seconds_log10 > 300.0) {
        return "centuries";
    }
    return DisplayCrackTime(std::pow(10.0, seconds_log10));
}

}  // namespace

std::unique_ptr<IStrengthModel> StrengthModelFactory::Create(const std::string_view model_name, GenStatus& out_status) {
    std::string normalized(model_name);
    for (char& ch : normalized) {
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
    }

    if (normalized == "zxcvbn") {
        out_status = GenStatus::Ok;
        return std::make_unique<ZxcvbnStrengthModel>();
    }

    out_status = GenStatus::UnknownStrengthModel;
    return nullptr;
}

int ScoreFromGuessesLog10(const double guesses_log10) {
    constexpr double kDelta = 5.0;
    const double guesses = std::pow(10.0, guesses_log10);
    if (guesses < 1e3 + kDelta) {
        return 0;
    }
    if (guesses < 1e6 + kDelta) {
        return 1;
    }
    if (guesses < 1e8 + kDelta) {
        return 2;
    }
    if (guesses < 1e10 + kDelta) {
        return 3;
    }
    return 4;
}

std::string DisplayCrackTime(const double seconds) {
    constexpr double kMinute = 60.0;
    constexpr double kHour = kMinute * 60.0;
    constexpr double kDay = kHour * 24.0;
    constexpr double kMonth = kDay * 31.0;
    constexpr double kYear = kMonth * 12.0;
    constexpr double kCentury = kYear * 100.0;

    if (seconds < 1.0) {
        return "less than a second";
    }

    double base = 0.0;
    const char* unit = nullptr;
    if (seconds < kMinute) {
        base = std::round(seconds);
        unit = "second";
    } else if (seconds < kHour) {
        base = std::round(seconds / kMinute);
        unit = "minute";
    } else if (seconds < kDay) {
        base = std::round(seconds / kHour);
        unit = "hour";
    } else if (seconds < kMonth) {
        base = std::round(seconds / kDay);
        unit = "day";
    } else if (seconds < kYear) {
        base = std::round(seconds / kMonth);
        unit = "month";
    } else if (seconds < kCentury) {
        base = std::round(seconds / kYear);
        unit = "year";
    } else {
        return "centuries";
    }

    const long long count = static_cast<long long>(base);
    std::string text = std::to_string(count) + " " + unit;
    if (count != 1) {
        text.push_back('s');
    }
    return text;
}

CrackTimesDisplay EstimateCrackTimes(const double guesses_log10) {
    CrackTimesDisplay display;
    display.online_throttling_100_per_hour = DisplayCrackTimeForRate(guesses_log10, kOnlineThrottledRate);
    display.online_no_throttling_10_per_second = DisplayCrackTimeForRate(guesses_log10, kOnlineUnthrottledRate);
    display.offline_slow_hashing_1e4_per_second = DisplayCrackTimeForRate(guesses_log10, kOfflineSlowRate);
    display.offline_fast_hashing_1e10_per_second = DisplayCrackTimeForRate(guesses_log10, kOfflineFastRate);
    return display;
}

}  // namespace secretgen

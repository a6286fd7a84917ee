#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "secretgen/gen_status.hpp"

namespace secretgen {

// Guess rates (guesses per second) for the four attack scenarios.
constexpr double kOnlineThrottledRate = 100.0 / 3600.0;
constexpr double kOnlineUnthrottledRate = 10.0;
constexpr double kOfflineSlowRate = 1e4;
constexpr double kOfflineFastRate = 1e10;

struct CrackTimesDisplay {
    std::string online_throttling_100_per_hour;
    std::string online_no_throttling_10_per_second;
    std::string offline_slow_hashing_1e4_per_second;
    std::string offline_fast_hashing_1e10_per_second;
};

struct StrengthReport {
    double guesses_log10 = 0.0;
    int score = 0;
    CrackTimesDisplay crack_times_display;
};

class IStrengthModel {
public:
    virtual ~IStrengthModel() = default;

    virtual GenStatus Assess(std::string_view input, StrengthReport& out_report) const = 0;
    virtual std::string_view Name() const = 0;
};

class StrengthModelFactory {
public:
    // Known models: "zxcvbn". Unknown names set UnknownStrengthModel.
    static std::unique_ptr<IStrengthModel> Create(std::string_view model_name, GenStatus& out_status);
};

// 0..4 bucket on the log10 guess count.
int ScoreFromGuessesLog10(double guesses_log10);

// Human wording for an attack duration ("3 hours", "centuries").
std::string DisplayCrackTime(double seconds);

// Builds all four scenarios from a log10 guess count.
CrackTimesDisplay EstimateCrackTimes(double guesses_log10);

}  // namespace secretgen

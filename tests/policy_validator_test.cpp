#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "secretgen/policy.hpp"

namespace secretgen {
namespace {

GenStatus ResolveLayers(const std::vector<PolicyOverrides>& layers, GenerationPolicy& out_policy) {
    return PolicyValidator(DefaultRegistry()).Resolve(MergeOverrides(layers), out_policy);
}

TEST(PolicyValidatorTest, BuiltInDefaults) {
    GenerationPolicy policy;
    ASSERT_EQ(ResolveLayers({PolicyOverrides::BuiltInDefaults()}, policy), GenStatus::Ok);
    EXPECT_EQ(policy.length, 20U);
    EXPECT_FALSE(policy.allow_ambiguous);
    for (const CharacterClass cls : kAllCharacterClasses) {
        EXPECT_TRUE(policy.Includes(cls));
        EXPECT_EQ(policy.MinimumOf(cls), 1U);
    }
}

TEST(PolicyValidatorTest, LaterLayersWinFieldByField) {
    PolicyOverrides profile;
    profile.length = 12;
    profile.minimum[IndexOf(CharacterClass::Digit)] = 3;
    profile.include[IndexOf(CharacterClass::Symbol)] = false;

    PolicyOverrides flags;
    flags.length = 16;
    flags.include[IndexOf(CharacterClass::Symbol)] = true;

    GenerationPolicy policy;
    ASSERT_EQ(ResolveLayers({PolicyOverrides::BuiltInDefaults(), profile, flags}, policy), GenStatus::Ok);
    EXPECT_EQ(policy.length, 16U);
    EXPECT_EQ(policy.MinimumOf(CharacterClass::Digit), 3U);
    EXPECT_TRUE(policy.Includes(CharacterClass::Symbol));
    EXPECT_EQ(policy.MinimumOf(CharacterClass::Symbol), 1U);
}

TEST(PolicyValidatorTest, DisabledClassForcesMinimumToZero) {
    PolicyOverrides flags;
    flags.include[IndexOf(CharacterClass::Symbol)] = false;
    flags.minimum[IndexOf(CharacterClass::Symbol)] = 5;

    GenerationPolicy policy;
    ASSERT_EQ(ResolveLayers({PolicyOverrides::BuiltInDefaults(), flags}, policy), GenStatus::Ok);
    EXPECT_FALSE(policy.Includes(CharacterClass::Symbol));
    EXPECT_EQ(policy.MinimumOf(CharacterClass::Symbol), 0U);
    EXPECT_EQ(policy.MinimumOf(CharacterClass::Digit), 1U);
}

TEST(PolicyValidatorTest, RejectsNonPositiveLength) {
    GenerationPolicy policy;
    PolicyOverrides zero;
    zero.length = 0;
    EXPECT_EQ(ResolveLayers({zero}, policy), GenStatus::InvalidLength);

    PolicyOverrides negative;
    negative.length = -4;
    EXPECT_EQ(ResolveLayers({negative}, policy), GenStatus::InvalidLength);
}

TEST(PolicyValidatorTest, RejectsLengthAboveLimit) {
    GenerationPolicy policy;
    PolicyOverrides at_limit;
    at_limit.length = static_cast<std::int64_t>(kMaxPasswordLength);
    EXPECT_EQ(ResolveLayers({at_limit}, policy), GenStatus::Ok);

    PolicyOverrides huge;
    huge.length = std::numeric_limits<std::int64_t>::max();
    EXPECT_EQ(ResolveLayers({huge}, policy), GenStatus::InvalidLength);

    GenerationPolicy stored;
    stored.length = kMaxPasswordLength + 1;
    GenerationPlan plan;
    EXPECT_EQ(PolicyValidator(DefaultRegistry()).Plan(stored, plan), GenStatus::InvalidLength);
}

TEST(PolicyValidatorTest, RejectsNegativeMinimum) {
    PolicyOverrides flags;
    flags.minimum[IndexOf(CharacterClass::Lower)] = -1;
    GenerationPolicy policy;
    EXPECT_EQ(ResolveLayers({flags}, policy), GenStatus::InvalidLength);
}

TEST(PolicyValidatorTest, RejectsWhenNoClassIsEnabled) {
    PolicyOverrides flags;
    for (auto& include : flags.include) {
        include = false;
    }
    GenerationPolicy policy;
    EXPECT_EQ(ResolveLayers({flags}, policy), GenStatus::NoClassEnabled);
}

TEST(PolicyValidatorTest, QuotaMustFitLength) {
    PolicyOverrides flags;
    flags.length = 3;
    flags.minimum[IndexOf(CharacterClass::Digit)] = 4;
    GenerationPolicy policy;
    EXPECT_EQ(ResolveLayers({flags}, policy), GenStatus::InfeasibleQuota);

    PolicyOverrides exact;
    exact.length = 4;
    GenerationPolicy exact_policy;
    EXPECT_EQ(ResolveLayers({exact}, exact_policy), GenStatus::Ok);
    EXPECT_EQ(exact_policy.length, 4U);
}

TEST(PolicyValidatorTest, HugeMinimumsCannotWrapTheQuotaSum) {
    constexpr std::int64_t kHuge = std::numeric_limits<std::int64_t>::max();
    PolicyOverrides flags;
    flags.length = 1;
    flags.minimum[IndexOf(CharacterClass::Lower)] = kHuge;
    flags.minimum[IndexOf(CharacterClass::Upper)] = kHuge;
    flags.minimum[IndexOf(CharacterClass::Digit)] = 2;
    flags.minimum[IndexOf(CharacterClass::Symbol)] = 0;

    GenerationPlan plan;
    EXPECT_EQ(PolicyValidator(DefaultRegistry()).ResolvePlan({PolicyOverrides::BuiltInDefaults(), flags}, plan),
              GenStatus::InfeasibleQuota);

    GenerationPolicy stored;
    stored.length = 1;
    stored.minimum = {std::numeric_limits<std::size_t>::max(), std::numeric_limits<std::size_t>::max(), 2, 0};
    EXPECT_EQ(PolicyValidator(DefaultRegistry()).Plan(stored, plan), GenStatus::InfeasibleQuota);
}

TEST(PolicyValidatorTest, PlanFiltersAmbiguousCharactersFromPool) {
    GenerationPlan plan;
    ASSERT_EQ(PolicyValidator(DefaultRegistry()).ResolvePlan({PolicyOverrides::BuiltInDefaults()}, plan),
              GenStatus::Ok);
    ASSERT_EQ(plan.classes.size(), 4U);
    for (const char ch : std::string("0Oo1lI|")) {
        EXPECT_EQ(plan.pool.find(ch), std::string::npos) << ch;
    }
    EXPECT_EQ(plan.pool.size(), 24U + 24U + 8U + 24U);
}

TEST(PolicyValidatorTest, EmptiedEnabledClassFails) {
    const CharacterClassRegistry registry({"ab", "AB", "01", "!"}, "01");
    PolicyOverrides flags;
    flags.minimum[IndexOf(CharacterClass::Digit)] = 0;

    GenerationPlan plan;
    EXPECT_EQ(PolicyValidator(registry).ResolvePlan({flags}, plan), GenStatus::EmptyClass);

    flags.allow_ambiguous = true;
    EXPECT_EQ(PolicyValidator(registry).ResolvePlan({flags}, plan), GenStatus::Ok);
}

TEST(PolicyValidatorTest, PlanRejectsInfeasibleStoredPolicy) {
    GenerationPolicy stored;
    stored.length = 3;
    stored.minimum = {1, 1, 4, 0};

    GenerationPlan plan;
    plan.pool = "unchanged";
    EXPECT_EQ(PolicyValidator(DefaultRegistry()).Plan(stored, plan), GenStatus::InfeasibleQuota);
    EXPECT_EQ(plan.pool, "unchanged");
}

TEST(PolicyOverridesTest, FromPolicyRoundTripsThroughResolve) {
    GenerationPolicy stored;
    stored.length = 24;
    stored.include[IndexOf(CharacterClass::Symbol)] = false;
    stored.minimum[IndexOf(CharacterClass::Symbol)] = 0;
    stored.minimum[IndexOf(CharacterClass::Digit)] = 3;
    stored.allow_ambiguous = true;

    GenerationPolicy resolved;
    ASSERT_EQ(ResolveLayers({PolicyOverrides::BuiltInDefaults(), PolicyOverrides::FromPolicy(stored)}, resolved),
              GenStatus::Ok);
    EXPECT_EQ(resolved, stored);
}

TEST(PolicyOverridesTest, ReenabledClassGetsDefaultMinimum) {
    GenerationPolicy stored;
    stored.include[IndexOf(CharacterClass::Digit)] = false;
    stored.minimum[IndexOf(CharacterClass::Digit)] = 0;

    const PolicyOverrides layer = PolicyOverrides::FromPolicy(stored);
    EXPECT_FALSE(layer.minimum[IndexOf(CharacterClass::Digit)].has_value());
    EXPECT_EQ(layer.minimum[IndexOf(CharacterClass::Lower)], std::optional<std::int64_t>(1));

    PolicyOverrides flags;
    flags.include[IndexOf(CharacterClass::Digit)] = true;

    GenerationPolicy resolved;
    ASSERT_EQ(ResolveLayers({PolicyOverrides::BuiltInDefaults(), layer, flags}, resolved), GenStatus::Ok);
    EXPECT_TRUE(resolved.Includes(CharacterClass::Digit));
    EXPECT_EQ(resolved.MinimumOf(CharacterClass::Digit), 1U);
}

}  // namespace
}  // namespace secretgen

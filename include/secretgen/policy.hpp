#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "secretgen/character_class.hpp"
#include "secretgen/gen_status.hpp"

namespace secretgen {

constexpr std::size_t kDefaultPasswordLength = 20;
constexpr std::size_t kMaxPasswordLength = 4096;

struct GenerationPolicy {
    std::size_t length = kDefaultPasswordLength;
    std::array<bool, kCharacterClassCount> include{{true, true, true, true}};
    std::array<std::size_t, kCharacterClassCount> minimum{{1, 1, 1, 1}};
    bool allow_ambiguous = false;

    bool Includes(const CharacterClass cls) const {
        return include[IndexOf(cls)];
    }
    std::size_t MinimumOf(const CharacterClass cls) const {
        return minimum[IndexOf(cls)];
    }
};

bool operator==(const GenerationPolicy& lhs, const GenerationPolicy& rhs);
bool operator!=(const GenerationPolicy& lhs, const GenerationPolicy& rhs);

// One layer of the defaults -> stored profile -> explicit flags chain.
// Numbers are signed so that negative requests reach the validator.
struct PolicyOverrides {
    std::optional<std::int64_t> length;
    std::array<std::optional<bool>, kCharacterClassCount> include{};
    std::array<std::optional<std::int64_t>, kCharacterClassCount> minimum{};
    std::optional<bool> allow_ambiguous;

    static PolicyOverrides BuiltInDefaults();
    static PolicyOverrides FromPolicy(const GenerationPolicy& policy);
};

// Later layers win field by field.
PolicyOverrides MergeOverrides(const std::vector<PolicyOverrides>& layers);

struct ClassPlan {
    CharacterClass cls = CharacterClass::Lower;
    std::string members;
    std::size_t minimum = 0;
};

struct GenerationPlan {
    GenerationPolicy policy;
    std::vector<ClassPlan> classes;  // enabled classes only, registry order
    std::string pool;                // union of the filtered members
};

class PolicyValidator {
public:
    explicit PolicyValidator(const CharacterClassRegistry& registry) : registry_(registry) {}

    GenStatus Resolve(const PolicyOverrides& merged, GenerationPolicy& out_policy) const;
    GenStatus Plan(const GenerationPolicy& policy, GenerationPlan& out_plan) const;

    // Resolve followed by Plan.
    GenStatus ResolvePlan(const std::vector<PolicyOverrides>& layers, GenerationPlan& out_plan) const;

private:
    const CharacterClassRegistry& registry_;
};

}  // namespace secretgen

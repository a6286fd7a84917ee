#include "secretgen/policy.hpp"

#include <utility>

namespace secretgen {

namespace {

// Running sum bounded by the length, so huge minimums cannot wrap it.
bool MinimumsFitLength(const GenerationPolicy& policy) {
    std::size_t total = 0;
    for (const CharacterClass cls : kAllCharacterClasses) {
        if (!policy.Includes(cls)) {
            continue;
        }
        const std::size_t minimum = policy.MinimumOf(cls);
        if (minimum > policy.length - total) {
            return false;
        }
        total += minimum;
    }
    return true;
}

}  // namespace

bool operator==(const GenerationPolicy& lhs, const GenerationPolicy& rhs) {
    return lhs.length == rhs.length &&
        lhs.include == rhs.include &&
        lhs.minimum == rhs.minimum &&
        lhs.allow_ambiguous == rhs.allow_ambiguous;
}

bool operator!=(const GenerationPolicy& lhs, const GenerationPolicy& rhs) {
    return !(lhs == rhs);
}

PolicyOverrides PolicyOverrides::BuiltInDefaults() {
    PolicyOverrides defaults;
    defaults.length = static_cast<std::int64_t>(kDefaultPasswordLength);
    for (auto& include : defaults.include) {
        include = true;
    }
    defaults.allow_ambiguous = false;
    return defaults;
}

PolicyOverrides PolicyOverrides::FromPolicy(const GenerationPolicy& policy) {
    PolicyOverrides layer;
    layer.length = static_cast<std::int64_t>(policy.length);
    for (std::size_t i = 0; i < kCharacterClassCount; ++i) {
        layer.include[i] = policy.include[i];
        // A disabled class carries no minimum, so re-enabling it later gets the default.
        if (policy.include[i]) {
            layer.minimum[i] = static_cast<std::int64_t>(policy.minimum[i]);
        }
    }
    layer.allow_ambiguous = policy.allow_ambiguous;
    return layer;
}

PolicyOverrides MergeOverrides(const std::vector<PolicyOverrides>& layers) {
    PolicyOverrides merged;
    for (const auto& layer : layers) {
        if (layer.length.has_value()) {
            merged.length = layer.length;
        }
        for (std::size_t i = 0; i < kCharacterClassCount; ++i) {
            if (layer.include[i].has_value()) {
                merged.include[i] = layer.include[i];
            }
            if (layer.minimum[i].has_value()) {
                merged.minimum[i] = layer.minimum[i];
            }
        }
        if (layer.allow_ambiguous.has_value()) {
            merged.allow_ambiguous = layer.allow_ambiguous;
        }
    }
    return merged;
}

GenStatus PolicyValidator::Resolve(const PolicyOverrides& merged, GenerationPolicy& out_policy) const {
    GenerationPolicy policy;

    const std::int64_t length = merged.length.value_or(static_cast<std::int64_t>(kDefaultPasswordLength));
    if (length < 1 || static_cast<std::uint64_t>(length) > kMaxPasswordLength) {
        return GenStatus::InvalidLength;
    }
    policy.length = static_cast<std::size_t>(length);
    policy.allow_ambiguous = merged.allow_ambiguous.value_or(false);

    bool any_enabled = false;
    for (std::size_t i = 0; i < kCharacterClassCount; ++i) {
        const bool enabled = merged.include[i].value_or(true);
        policy.include[i] = enabled;
        any_enabled = any_enabled || enabled;

        if (merged.minimum[i].has_value() && *merged.minimum[i] < 0) {
            return GenStatus::InvalidLength;
        }
        if (!enabled) {
            policy.minimum[i] = 0;
        } else if (merged.minimum[i].has_value()) {
            policy.minimum[i] = static_cast<std::size_t>(*merged.minimum[i]);
        } else {
            policy.minimum[i] = 1;
        }
    }

    if (!any_enabled) {
        return GenStatus::NoClassEnabled;
    }
    if (!MinimumsFitLength(policy)) {
        return GenStatus::InfeasibleQuota;
    }

    out_policy = policy;
    return GenStatus::Ok;
}

GenStatus PolicyValidator::Plan(const GenerationPolicy& policy, GenerationPlan& out_plan) const {
    if (policy.length < 1 || policy.length > kMaxPasswordLength) {
        return GenStatus::InvalidLength;
    }

    GenerationPlan plan;
    plan.policy = policy;
    for (const CharacterClass cls : kAllCharacterClasses) {
        if (!policy.Includes(cls)) {
            continue;
        }
        ClassPlan class_plan;
        class_plan.cls = cls;
        class_plan.members = registry_.Filtered(cls, policy.allow_ambiguous);
        class_plan.minimum = policy.MinimumOf(cls);
        // An enabled class must stay drawable: it feeds the fill pool even at minimum 0.
        if (class_plan.members.empty()) {
            return GenStatus::EmptyClass;
        }
        plan.pool += class_plan.members;
        plan.classes.push_back(std::move(class_plan));
    }

    if (plan.classes.empty()) {
        return GenStatus::NoClassEnabled;
    }
    if (!MinimumsFitLength(policy)) {
        return GenStatus::InfeasibleQuota;
    }

    out_plan = std::move(plan);
    return GenStatus::Ok;
}

GenStatus PolicyValidator::ResolvePlan(
    const std::vector<PolicyOverrides>& layers,
    GenerationPlan& out_plan) const {
    GenerationPolicy policy;
    const GenStatus resolve_status = Resolve(MergeOverrides(layers), policy);
    if (resolve_status != GenStatus::Ok) {
        return resolve_status;
    }
    return Plan(policy, out_plan);
}

}  // namespace secretgen

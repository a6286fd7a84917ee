#include "secretgen/password_generator.hpp"

#include <cstddef>
#include <utility>

namespace secretgen {

namespace {

GenStatus DrawFrom(const std::string& alphabet, IRandomSource& rng, char& out_char) {
    if (alphabet.empty()) {
        return GenStatus::EmptyClass;
    }
    std::size_t index = 0;
    const GenStatus status = rng.UniformIndex(alphabet.size(), index);
    if (status != GenStatus::Ok) {
        return status;
    }
    out_char = alphabet[index];
    return GenStatus::Ok;
}

}  // namespace

GenStatus PasswordGenerator::Generate(const GenerationPlan& plan, IRandomSource& rng, std::string& out_password) {
    const std::size_t length = plan.policy.length;
    if (length == 0) {
        return GenStatus::InvalidLength;
    }

    std::string working;
    working.reserve(length);

    auto fail = [&](const GenStatus error) -> GenStatus {
        SecureWipe(working);
        return error;
    };

    for (const ClassPlan& class_plan : plan.classes) {
        for (std::size_t i = 0; i < class_plan.minimum; ++i) {
            char ch = '\0';
            const GenStatus status = DrawFrom(class_plan.members, rng, ch);
            if (status != GenStatus::Ok) {
                return fail(status);
            }
            working.push_back(ch);
        }
    }
    if (working.size() > length) {
        return fail(GenStatus::InfeasibleQuota);
    }

    while (working.size() < length) {
        char ch = '\0';
        const GenStatus status = DrawFrom(plan.pool, rng, ch);
        if (status != GenStatus::Ok) {
            return fail(status);
        }
        working.push_back(ch);
    }

    const GenStatus shuffle_status = Shuffle(working, rng);
    if (shuffle_status != GenStatus::Ok) {
        return fail(shuffle_status);
    }

    SecureWipe(out_password);
    out_password = std::move(working);
    return GenStatus::Ok;
}

GenStatus PasswordGenerator::Shuffle(std::string& value, IRandomSource& rng) {
    if (value.size() < 2) {
        return GenStatus::Ok;
    }
    // Fisher-Yates, highest index down.
    for (std::size_t i = value.size() - 1; i > 0; --i) {
        std::size_t j = 0;
        const GenStatus status = rng.UniformIndex(i + 1, j);
        if (status != GenStatus::Ok) {
            return status;
        }
        std::swap(value[i], value[j]);
    }
    return GenStatus::Ok;
}

}  // namespace secretgen

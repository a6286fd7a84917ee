#pragma once

#include <string>

#include "secretgen/gen_status.hpp"
#include "secretgen/policy.hpp"
#include "secretgen/random_source.hpp"

namespace secretgen {

class PasswordGenerator {
public:
    // Draws the per-class minimums, fills the rest from the pool and shuffles.
    // The plan must come from PolicyValidator.
    static GenStatus Generate(const GenerationPlan& plan, IRandomSource& rng, std::string& out_password);

    // Uniform in-place permutation of value.
    static GenStatus Shuffle(std::string& value, IRandomSource& rng);
};

}  // namespace secretgen

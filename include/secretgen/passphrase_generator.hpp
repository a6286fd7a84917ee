#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "secretgen/gen_status.hpp"
#include "secretgen/random_source.hpp"

namespace secretgen {

constexpr std::size_t kDefaultPassphraseWordCount = 6;
constexpr std::size_t kMaxPassphraseWordCount = 1024;
constexpr const char* kDefaultPassphraseSeparator = "-";

struct WordPolicy {
    std::size_t word_count = kDefaultPassphraseWordCount;
    std::string separator = kDefaultPassphraseSeparator;
    bool title_case = false;
    std::vector<std::string> vocabulary;
};

class PassphraseGenerator {
public:
    static GenStatus Validate(const WordPolicy& policy);

    // Words are drawn with replacement; repeats are expected on small vocabularies.
    static GenStatus Generate(const WordPolicy& policy, IRandomSource& rng, std::string& out_phrase);

    // First letter upper-cased (ASCII), the rest unchanged.
    static std::string TitleCase(std::string_view word);
};

}  // namespace secretgen

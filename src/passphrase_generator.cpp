#include "secretgen/passphrase_generator.hpp"

#include <cctype>
#include <utility>

namespace secretgen {

GenStatus PassphraseGenerator::Validate(const WordPolicy& policy) {
    if (policy.word_count == 0 || policy.word_count > kMaxPassphraseWordCount) {
        return GenStatus::InvalidCount;
    }
    if (policy.vocabulary.empty()) {
        return GenStatus::EmptyVocabulary;
    }
    return GenStatus::Ok;
}

GenStatus PassphraseGenerator::Generate(const WordPolicy& policy, IRandomSource& rng, std::string& out_phrase) {
    const GenStatus valid = Validate(policy);
    if (valid != GenStatus::Ok) {
        return valid;
    }

    std::string phrase;
    for (std::size_t i = 0; i < policy.word_count; ++i) {
        std::size_t index = 0;
        const GenStatus status = rng.UniformIndex(policy.vocabulary.size(), index);
        if (status != GenStatus::Ok) {
            SecureWipe(phrase);
            return status;
        }
        if (i > 0) {
            phrase += policy.separator;
        }
        const std::string& word = policy.vocabulary[index];
        if (policy.title_case) {
            phrase += TitleCase(word);
        } else {
            phrase += word;
        }
    }

    SecureWipe(out_phrase);
    out_phrase = std::move(phrase);
    return GenStatus::Ok;
}

std::string PassphraseGenerator::TitleCase(const std::string_view word) {
    std::string out(word);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

}  // namespace secretgen

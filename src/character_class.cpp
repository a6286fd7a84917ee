#include "secretgen/character_class.hpp"

#include <string>
#include <utility>

namespace secretgen {

std::string_view ToString(const CharacterClass cls) {
    switch (cls) {
        case CharacterClass::Lower:
            return "lowercase";
        case CharacterClass::Upper:
            return "uppercase";
        case CharacterClass::Digit:
            return "digits";
        case CharacterClass::Symbol:
            return "symbols";
    }
    return "unknown";
}

CharacterClassRegistry::CharacterClassRegistry(
    std::array<std::string, kCharacterClassCount> members,
    std::string ambiguous)
    : members_(std::move(members)), ambiguous_(std::move(ambiguous)) {}

const std::string& CharacterClassRegistry::Members(const CharacterClass cls) const {
    return members_[IndexOf(cls)];
}

const std::string& CharacterClassRegistry::Ambiguous() const {
    return ambiguous_;
}

bool CharacterClassRegistry::IsAmbiguous(const char ch) const {
    return ambiguous_.find(ch) != std::string::npos;
}

std::string CharacterClassRegistry::Filtered(const CharacterClass cls, const bool allow_ambiguous) const {
    const std::string& members = Members(cls);
    if (allow_ambiguous) {
        return members;
    }
    std::string out;
    out.reserve(members.size());
    for (const char ch : members) {
        if (!IsAmbiguous(ch)) {
            out.push_back(ch);
        }
    }
    return out;
}

const CharacterClassRegistry& DefaultRegistry() {
    static const CharacterClassRegistry registry(
        {
            "abcdefghijklmnopqrstuvwxyz",
            "ABCDEFGHIJKLMNOPQRSTUVWXYZ",
            "0123456789",
            "!@#$%^&*()-_=+[]{}<>?/\\|~",
        },
        "0Oo1lI|");
    return registry;
}

}  // namespace secretgen

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace secretgen {

enum class CharacterClass {
    Lower = 0,
    Upper,
    Digit,
    Symbol
};

constexpr std::size_t kCharacterClassCount = 4;

constexpr std::array<CharacterClass, kCharacterClassCount> kAllCharacterClasses = {
    CharacterClass::Lower, CharacterClass::Upper, CharacterClass::Digit, CharacterClass::Symbol};

inline std::size_t IndexOf(const CharacterClass cls) {
    return static_cast<std::size_t>(cls);
}

std::string_view ToString(CharacterClass cls);

// Immutable table of member characters per class plus the ambiguous set.
// Built once; everything downstream takes it by const reference.
class CharacterClassRegistry {
public:
    CharacterClassRegistry(
        std::array<std::string, kCharacterClassCount> members,
        std::string ambiguous);

    const std::string& Members(CharacterClass cls) const;
    const std::string& Ambiguous() const;
    bool IsAmbiguous(char ch) const;

    // Members with the ambiguous characters removed when allow_ambiguous is false.
    std::string Filtered(CharacterClass cls, bool allow_ambiguous) const;

private:
    std::array<std::string, kCharacterClassCount> members_;
    std::string ambiguous_;
};

const CharacterClassRegistry& DefaultRegistry();

}  // namespace secretgen

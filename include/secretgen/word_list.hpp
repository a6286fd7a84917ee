#pragma once

#include <string>
#include <vector>

#include "secretgen/gen_status.hpp"

namespace secretgen {

class WordList {
public:
    // One word per line. Lines are trimmed, blank lines skipped and later
    // duplicates dropped. The file must be UTF-8.
    static GenStatus Load(const std::string& path, std::vector<std::string>& out_words);

    static const std::vector<std::string>& BuiltIn();
};

}  // namespace secretgen

#include "secretgen/word_list.hpp"

#include <fstream>
#include <unordered_set>
#include <utility>

#include "secretgen/text_util.hpp"

namespace secretgen {

GenStatus WordList::Load(const std::string& path, std::vector<std::string>& out_words) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return GenStatus::FileIOError;
    }

    std::vector<std::string> entries;
    std::unordered_set<std::string> seen;

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!IsValidUtf8(line)) {
            return GenStatus::InvalidEncoding;
        }
        std::string token = TrimAsciiWhitespace(line);
        if (token.empty()) {
            continue;
        }
        if (!seen.insert(token).second) {
            continue;
        }
        entries.push_back(std::move(token));
    }
    if (file.bad()) {
        return GenStatus::FileIOError;
    }

    if (entries.empty()) {
        return GenStatus::EmptyVocabulary;
    }
    out_words = std::move(entries);
    return GenStatus::Ok;
}

const std::vector<std::string>& WordList::BuiltIn() {
    static const std::vector<std::string> words = {
        "anchor",
        "binary",
        "cobalt",
        "delta",
        "ember",
        "flux",
        "gamma",
        "harbor",
        "ion",
        "jolt",
        "keystone",
        "lumen",
        "matrix",
        "nebula",
        "oxide",
        "pixel",
        "quartz",
        "radial",
        "sonic",
        "tangent",
        "umbra",
        "vector",
        "warp",
        "xenon",
        "yonder",
        "zenith",
    };
    return words;
}

}  // namespace secretgen

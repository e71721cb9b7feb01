#include "relic/text_similarity.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace RIE {
namespace TextSimilarity {

namespace {

constexpr const char* WHITESPACE = " \t\r\n\f\v";

bool isSeparator(char c) {
    return c == ' ' || c == '-' || c == ',';
}

const std::string& shortestName(const std::vector<std::string>& names) {
    // EN: First name of minimal length
    // FR: Premier nom de longueur minimale
    return *std::min_element(names.begin(), names.end(),
                             [](const std::string& a, const std::string& b) { return a.size() < b.size(); });
}

} // namespace

std::string trim(const std::string& value) {
    return trimRight(trimLeft(value));
}

std::string trimLeft(const std::string& value) {
    size_t start = value.find_first_not_of(WHITESPACE);
    return start == std::string::npos ? std::string() : value.substr(start);
}

std::string trimRight(const std::string& value) {
    size_t end = value.find_last_not_of(WHITESPACE);
    return end == std::string::npos ? std::string() : value.substr(0, end + 1);
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string toLowerAscii(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::vector<std::string> splitWords(const std::string& value) {
    std::vector<std::string> words;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t start = value.find_first_not_of(WHITESPACE, pos);
        if (start == std::string::npos) {
            break;
        }
        size_t end = value.find_first_of(WHITESPACE, start);
        if (end == std::string::npos) {
            end = value.size();
        }
        words.push_back(value.substr(start, end - start));
        pos = end;
    }
    return words;
}

std::string joinWords(const std::vector<std::string>& words, size_t count) {
    std::string joined;
    for (size_t i = 0; i < count && i < words.size(); ++i) {
        if (i > 0) joined += ' ';
        joined += words[i];
    }
    return joined;
}

std::optional<Nightfarer> bracketTag(const std::string& name) {
    for (Nightfarer nightfarer : ALL_NIGHTFARERS) {
        if (startsWith(name, "[" + nightfarerToString(nightfarer) + "] ")) {
            return nightfarer;
        }
    }
    return std::nullopt;
}

std::string stripBracketTag(const std::string& name) {
    auto tag = bracketTag(name);
    if (!tag) {
        return name;
    }
    return name.substr(nightfarerToString(*tag).size() + 3);
}

std::string commonPrefix(const std::vector<std::string>& names) {
    if (names.empty()) {
        return "";
    }

    const std::string& shortest = shortestName(names);
    size_t length = 0;
    while (length < shortest.size()) {
        char c = shortest[length];
        bool shared = std::all_of(names.begin(), names.end(),
                                  [&](const std::string& name) { return name[length] == c; });
        if (!shared) break;
        ++length;
    }

    std::string prefix = shortest.substr(0, length);
    if (prefix.size() > 3 && isSeparator(prefix.back())) {
        return trimRight(prefix);
    }
    return "";
}

std::string commonSuffix(const std::vector<std::string>& names) {
    if (names.empty()) {
        return "";
    }

    const std::string& shortest = shortestName(names);
    size_t length = 0;
    while (length < shortest.size()) {
        char c = shortest[shortest.size() - 1 - length];
        bool shared = std::all_of(names.begin(), names.end(), [&](const std::string& name) {
            return name[name.size() - 1 - length] == c;
        });
        if (!shared) break;
        ++length;
    }

    std::string suffix = shortest.substr(shortest.size() - length);
    if (suffix.size() > 3 && isSeparator(suffix.front())) {
        return trimLeft(suffix);
    }
    return "";
}

std::string commonLeadingWords(const std::vector<std::string>& names) {
    if (names.empty()) {
        return "";
    }

    std::vector<std::vector<std::string>> word_lists;
    word_lists.reserve(names.size());
    size_t min_words = SIZE_MAX;
    for (const auto& name : names) {
        word_lists.push_back(splitWords(name));
        min_words = std::min(min_words, word_lists.back().size());
    }

    size_t shared = 0;
    while (shared < min_words) {
        const std::string& word = word_lists.front()[shared];
        bool same = std::all_of(word_lists.begin(), word_lists.end(),
                                [&](const std::vector<std::string>& words) { return words[shared] == word; });
        if (!same) break;
        ++shared;
    }
    return joinWords(word_lists.front(), shared);
}

std::string longestCommonSubstring(const std::vector<std::string>& names) {
    if (names.size() < 2) {
        return "";
    }

    const std::string& shortest = shortestName(names);
    if (shortest.size() < 3) {
        return "";
    }

    std::vector<std::string> lowered;
    lowered.reserve(names.size());
    for (const auto& name : names) {
        lowered.push_back(toLowerAscii(name));
    }

    size_t best_length = 0;
    std::string best_casing;

    for (size_t i = 0; i < shortest.size(); ++i) {
        for (size_t j = i + 3; j <= shortest.size(); ++j) {
            size_t length = j - i;
            if (length <= best_length) {
                continue;
            }
            if (!isSeparator(shortest[j - 1]) && length < 10) {
                continue;
            }
            std::string needle = toLowerAscii(shortest.substr(i, length));
            bool everywhere = std::all_of(lowered.begin(), lowered.end(),
                                          [&](const std::string& name) { return name.find(needle) != std::string::npos; });
            if (!everywhere) {
                continue;
            }

            best_length = length;

            // EN: Count the original casings in name order; the first one reaching the top count wins
            // FR: Compte les casses d'origine dans l'ordre des noms ; la première atteignant le maximum gagne
            std::vector<std::pair<std::string, size_t>> casings;
            for (size_t k = 0; k < names.size(); ++k) {
                std::string version = names[k].substr(lowered[k].find(needle), length);
                auto it = std::find_if(casings.begin(), casings.end(),
                                       [&](const auto& entry) { return entry.first == version; });
                if (it == casings.end()) {
                    casings.emplace_back(version, 1);
                } else {
                    it->second++;
                }
            }
            auto top = casings.begin();
            for (auto it = casings.begin(); it != casings.end(); ++it) {
                if (it->second > top->second) top = it;
            }
            best_casing = top->first;
        }
    }

    if (best_casing.empty()) {
        return "";
    }

    std::string result = best_casing;
    std::string right_trimmed = trimRight(result);
    if (!right_trimmed.empty() && right_trimmed.back() == '+') {
        size_t end = right_trimmed.find_last_not_of('+');
        result = trimRight(end == std::string::npos ? std::string() : right_trimmed.substr(0, end + 1));
    }

    std::string stripped = trim(result);
    if (!stripped.empty() && std::islower(static_cast<unsigned char>(stripped[0]))) {
        stripped[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(stripped[0])));
        result = stripped;
    }
    return trimRight(result);
}

bool isWordSubsequence(const std::vector<std::string>& shorter, const std::vector<std::string>& longer) {
    size_t matched = 0;
    for (const auto& word : longer) {
        if (matched < shorter.size() && word == shorter[matched]) {
            ++matched;
        }
    }
    return matched == shorter.size();
}

bool hasSingleWordInsertion(const std::vector<std::string>& shorter, const std::vector<std::string>& longer) {
    if (longer.size() != shorter.size() + 1) {
        return false;
    }

    size_t i = 0;
    size_t j = 0;
    size_t extra_words = 0;
    while (i < shorter.size() && j < longer.size()) {
        if (shorter[i] == longer[j]) {
            ++i;
            ++j;
        } else {
            ++j;
            if (++extra_words > 1) {
                return false;
            }
        }
    }
    return i == shorter.size();
}

bool areWordVariants(const std::string& first, const std::string& second) {
    std::vector<std::string> words1 = splitWords(first);
    std::vector<std::string> words2 = splitWords(second);

    if (words1.size() > words2.size() + 1) {
        return isWordSubsequence(words2, words1);
    }
    if (words2.size() > words1.size() + 1) {
        return isWordSubsequence(words1, words2);
    }
    if (words1.size() + 1 == words2.size()) {
        return hasSingleWordInsertion(words1, words2);
    }
    if (words2.size() + 1 == words1.size()) {
        return hasSingleWordInsertion(words2, words1);
    }
    return false;
}

bool isTruncatedVariant(const std::string& first, const std::string& second) {
    const std::string clean1 = stripBracketTag(first);
    const std::string clean2 = stripBracketTag(second);

    if (clean1 == clean2) {
        return true;
    }

    if (startsWith(clean1, clean2 + " ") || startsWith(clean2, clean1 + " ")) {
        return true;
    }

    // EN: One is at least 1.5x the other and starts with it (integer form of the ratio)
    // FR: L'un fait au moins 1,5x l'autre et commence par lui (forme entière du ratio)
    if (2 * clean1.size() >= 3 * clean2.size() && startsWith(clean1, clean2)) {
        return true;
    }
    if (2 * clean2.size() >= 3 * clean1.size() && startsWith(clean2, clean1)) {
        return true;
    }

    return areWordVariants(clean1, clean2);
}

} // namespace TextSimilarity
} // namespace RIE

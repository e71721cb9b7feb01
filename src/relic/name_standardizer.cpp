#include "relic/name_standardizer.hpp"
#include "relic/text_similarity.hpp"
#include "infrastructure/logging/logger.hpp"
#include <vector>

namespace RIE {

namespace {

std::string replaceAll(std::string value, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
    return value;
}

} // namespace

std::string NameStandardizer::standardize(const std::string& name, std::optional<Nightfarer> nightfarer) {
    using TextSimilarity::startsWith;

    std::vector<Nightfarer> candidates;
    if (nightfarer) {
        candidates.push_back(*nightfarer);
    } else {
        candidates.assign(ALL_NIGHTFARERS.begin(), ALL_NIGHTFARERS.end());
    }

    std::string result = name;
    bool matched = false;
    for (Nightfarer candidate : candidates) {
        const std::string tag = nightfarerToString(candidate);
        if (startsWith(result, "[" + tag + "] ")) {
            matched = true;
        } else if (startsWith(result, tag + ": ")) {
            result = "[" + tag + "] " + result.substr(tag.size() + 2);
            matched = true;
        } else if (startsWith(result, tag + " ")) {
            result = "[" + tag + "] " + result.substr(tag.size() + 1);
            matched = true;
        }
        if (matched) break;
    }

    if (nightfarer && !matched) {
        // EN: A bracket tag naming another faction would contradict the record's faction
        // FR: Un tag d'une autre faction contredirait la faction de l'enregistrement
        auto stale = TextSimilarity::bracketTag(result);
        if (stale && *stale != *nightfarer) {
            result = TextSimilarity::stripBracketTag(result);
        }
        result = "[" + nightfarerToString(*nightfarer) + "] " + result;
    }

    return replaceAll(result, "- ", ", ");
}

size_t NameStandardizer::standardizeDataset(Dataset& dataset) {
    size_t changed = 0;

    for (auto& record : dataset.records) {
        std::string name = TextSimilarity::trim(record.name);
        if (record.nightfarer && !name.empty()) {
            std::string standardized = standardize(name, record.nightfarer);
            if (standardized != record.name) {
                record.name = standardized;
                changed++;
            }
        }
    }

    for (auto& record : dataset.records) {
        std::string name = TextSimilarity::trim(record.name);
        if (!name.empty() && !TextSimilarity::bracketTag(name)) {
            std::string standardized = standardize(name);
            if (standardized != record.name) {
                record.name = standardized;
                changed++;
            }
        }
    }

    LOG_DEBUG("standardizer", "Standardized " + std::to_string(changed) + " names");
    return changed;
}

} // namespace RIE

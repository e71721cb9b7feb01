#include "relic/group_autofiller.hpp"
#include "relic/text_similarity.hpp"
#include "infrastructure/logging/logger.hpp"
#include <cctype>
#include <limits>
#include <regex>
#include <stdexcept>
#include <unordered_map>

namespace RIE {

GroupAutofiller::GroupAutofiller(const AutofillOptions& options) : options_(options) {
}

AutofillStatistics GroupAutofiller::autofill(Dataset& dataset) const {
    AutofillStatistics stats;
    prefillDerivedFields(dataset, stats);

    std::vector<int> order;
    std::unordered_map<int, std::vector<RelicRecord*>> groups;
    for (auto& record : dataset.records) {
        if (options_.skipZeroGroup && record.levelGroupId == 0) {
            continue;
        }
        auto& members = groups[record.levelGroupId];
        if (members.empty()) {
            order.push_back(record.levelGroupId);
        }
        members.push_back(&record);
    }

    for (int group_id : order) {
        auto& members = groups[group_id];
        if (members.size() < 2) {
            continue;
        }

        std::vector<std::string> names;
        names.reserve(members.size());
        for (const RelicRecord* member : members) {
            names.push_back(member->name);
        }

        std::string label = findCommonText(names);
        if (!label.empty()) {
            for (RelicRecord* member : members) {
                member->levelGroup = label;
            }
            stats.groupsLabelled++;
            LOG_DEBUG("autofill", "Group " + std::to_string(group_id) + " labelled '" + label + "'");
        }

        stats.levelsAssigned += assignLevels(members);
    }

    std::unordered_map<std::string, std::string> metadata = {
        {"groups_labelled", std::to_string(stats.groupsLabelled)},
        {"levels_assigned", std::to_string(stats.levelsAssigned)},
        {"display_groups", std::to_string(stats.displayGroupsFilled)},
        {"categories", std::to_string(stats.categoriesFilled)}
    };
    LOG_INFO_META("autofill", "Autofill completed", metadata);
    return stats;
}

std::string GroupAutofiller::findCommonText(const std::vector<std::string>& names) {
    std::vector<std::string> clean_names;
    for (const auto& name : names) {
        if (!TextSimilarity::trim(name).empty()) {
            clean_names.push_back(TextSimilarity::trim(TextSimilarity::stripBracketTag(name)));
        }
    }
    if (clean_names.size() < 2) {
        return "";
    }

    const std::string candidates[] = {
        TextSimilarity::commonPrefix(clean_names),
        TextSimilarity::commonSuffix(clean_names),
        TextSimilarity::commonLeadingWords(clean_names),
        TextSimilarity::longestCommonSubstring(clean_names)
    };

    // EN: Longest wins, the earliest candidate on ties
    // FR: Le plus long l'emporte, le premier candidat en cas d'égalité
    const std::string* best = nullptr;
    for (const auto& candidate : candidates) {
        if (TextSimilarity::trim(candidate).empty()) {
            continue;
        }
        if (!best || candidate.size() > best->size()) {
            best = &candidate;
        }
    }
    if (!best) {
        return "";
    }

    std::string result = TextSimilarity::trim(*best);
    if (!result.empty() && std::islower(static_cast<unsigned char>(result[0]))) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

std::optional<int> GroupAutofiller::extractLevel(const std::string& name) {
    static const std::regex level_pattern(R"( \+(\d+)$)");
    std::smatch match;
    if (!std::regex_search(name, match, level_pattern)) {
        return std::nullopt;
    }
    try {
        int level = std::stoi(match[1].str());
        // EN: The mixed-group rule adds one, so the largest int is out of range too
        // FR: La règle des groupes mixtes ajoute un, donc le plus grand int est aussi hors limites
        if (level == std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return level;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

size_t GroupAutofiller::assignLevels(std::vector<RelicRecord*>& members) {
    if (members.size() < 2) {
        return 0;
    }

    std::vector<std::optional<int>> levels;
    levels.reserve(members.size());
    bool has_plain = false;
    bool has_suffixed = false;
    for (const RelicRecord* member : members) {
        levels.push_back(extractLevel(TextSimilarity::trim(member->name)));
        if (levels.back()) {
            has_suffixed = true;
        } else {
            has_plain = true;
        }
    }

    if (!has_suffixed) {
        return 0;
    }

    size_t assigned = 0;
    for (size_t i = 0; i < members.size(); ++i) {
        if (has_plain) {
            members[i]->level = levels[i] ? *levels[i] + 1 : 1;
        } else {
            members[i]->level = *levels[i];
        }
        assigned++;
    }
    return assigned;
}

void GroupAutofiller::prefillDerivedFields(Dataset& dataset, AutofillStatistics& stats) const {
    for (auto& record : dataset.records) {
        const std::string name = TextSimilarity::trim(record.name);

        if (options_.nightfarerDisplayGroup && !name.empty() && name[0] == '[') {
            size_t end_bracket = name.find(']');
            if (end_bracket != std::string::npos && end_bracket > 1) {
                std::string tag = TextSimilarity::trim(name.substr(1, end_bracket - 1));
                if (!tag.empty()) {
                    record.displayGroup = tag;
                    stats.displayGroupsFilled++;
                }
            }
        }

        if (options_.debuffCategory && record.debuff &&
            (!record.category || TextSimilarity::trim(*record.category).empty())) {
            record.category = "Debuff";
            stats.categoriesFilled++;
        }
    }
}

} // namespace RIE

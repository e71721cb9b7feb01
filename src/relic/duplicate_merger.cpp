#include "relic/duplicate_merger.hpp"
#include "relic/text_similarity.hpp"
#include "infrastructure/logging/logger.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>
#include <vector>

namespace RIE {

MergeStatistics DuplicateMerger::mergeDuplicates(Dataset& dataset) {
    MergeStatistics stats;

    while (true) {
        std::set<std::int64_t> removed;
        stats.passes++;

        size_t exact = mergeExactNames(dataset, removed);
        size_t truncated = mergeTruncatedNames(dataset, removed);
        removeMarked(dataset, removed);

        stats.exactMerges += exact;
        stats.truncatedMerges += truncated;

        if (exact + truncated == 0) {
            break;
        }
        LOG_DEBUG("merger", "Pass " + std::to_string(stats.passes) + " merged " +
                  std::to_string(exact + truncated) + " records");
    }

    std::unordered_map<std::string, std::string> metadata = {
        {"exact_merges", std::to_string(stats.exactMerges)},
        {"truncated_merges", std::to_string(stats.truncatedMerges)},
        {"passes", std::to_string(stats.passes)},
        {"records", std::to_string(dataset.records.size())}
    };
    LOG_INFO_META("merger", "Duplicate merge completed", metadata);
    return stats;
}

std::string DuplicateMerger::groupingKey(const std::string& name) {
    std::vector<std::string> words = TextSimilarity::splitWords(
        TextSimilarity::stripBracketTag(TextSimilarity::trim(name)));
    if (words.size() < 2) {
        return "";
    }
    return TextSimilarity::joinWords(words, 2);
}

bool DuplicateMerger::shareGameIds(const RelicRecord& first, const RelicRecord& second) {
    for (std::int64_t game_id : first.gameIds) {
        if (second.gameIds.count(game_id) > 0) {
            return true;
        }
    }
    return false;
}

size_t DuplicateMerger::mergeExactNames(Dataset& dataset, std::set<std::int64_t>& removed) {
    // EN: Groups in order of first appearance
    // FR: Groupes dans l'ordre de première apparition
    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<RelicRecord*>> groups;
    for (auto& record : dataset.records) {
        std::string name = TextSimilarity::trim(record.name);
        if (name.empty()) {
            continue;
        }
        auto& members = groups[name];
        if (members.empty()) {
            order.push_back(name);
        }
        members.push_back(&record);
    }

    size_t merged = 0;
    for (const auto& name : order) {
        auto& members = groups[name];
        if (members.size() < 2) {
            continue;
        }
        auto keep = *std::min_element(members.begin(), members.end(),
                                      [](const RelicRecord* a, const RelicRecord* b) { return a->id < b->id; });
        for (RelicRecord* member : members) {
            if (member == keep) {
                continue;
            }
            keep->gameIds.insert(member->gameIds.begin(), member->gameIds.end());
            removed.insert(member->id);
            merged++;
        }
    }
    return merged;
}

size_t DuplicateMerger::mergeTruncatedNames(Dataset& dataset, std::set<std::int64_t>& removed) {
    std::vector<std::string> order;
    std::map<std::string, std::vector<RelicRecord*>> groups;
    for (auto& record : dataset.records) {
        if (removed.count(record.id) > 0) {
            continue;
        }
        std::string key = groupingKey(record.name);
        if (key.empty()) {
            continue;
        }
        auto& members = groups[key];
        if (members.empty()) {
            order.push_back(key);
        }
        members.push_back(&record);
    }

    size_t merged = 0;
    for (const auto& key : order) {
        auto& members = groups[key];
        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                RelicRecord& first = *members[i];
                RelicRecord& second = *members[j];
                if (removed.count(first.id) > 0 || removed.count(second.id) > 0) {
                    continue;
                }
                // EN: Names are read live, an earlier merge in this group may have lengthened one
                // FR: Les noms sont lus en direct, une fusion précédente du groupe a pu en allonger un
                if (!TextSimilarity::isTruncatedVariant(TextSimilarity::trim(first.name),
                                                        TextSimilarity::trim(second.name))) {
                    continue;
                }
                if (!shareGameIds(first, second)) {
                    continue;
                }
                mergePair(first, second, removed);
                merged++;
            }
        }
    }
    return merged;
}

void DuplicateMerger::mergePair(RelicRecord& first, RelicRecord& second, std::set<std::int64_t>& removed) {
    RelicRecord& keep = first.id < second.id ? first : second;
    RelicRecord& drop = first.id < second.id ? second : first;

    const std::string keep_name = TextSimilarity::trim(keep.name);
    const std::string drop_name = TextSimilarity::trim(drop.name);
    if (TextSimilarity::stripBracketTag(drop_name).size() > TextSimilarity::stripBracketTag(keep_name).size()) {
        LOG_DEBUG("merger", "Renaming '" + keep_name + "' to '" + drop_name + "'");
        keep.name = drop_name;
    }

    keep.gameIds.insert(drop.gameIds.begin(), drop.gameIds.end());
    removed.insert(drop.id);
}

void DuplicateMerger::removeMarked(Dataset& dataset, const std::set<std::int64_t>& removed) {
    if (removed.empty()) {
        return;
    }
    std::vector<RelicRecord> survivors;
    survivors.reserve(dataset.records.size() - std::min(removed.size(), dataset.records.size()));
    for (auto& record : dataset.records) {
        if (removed.count(record.id) == 0) {
            survivors.push_back(std::move(record));
        }
    }
    dataset.records = std::move(survivors);
}

} // namespace RIE

// EN: Merge of duplicate and truncated-name relic records
// FR: Fusion des enregistrements de reliques en double ou à nom tronqué

#pragma once

#include "relic/dataset.hpp"
#include <cstdint>
#include <set>
#include <string>

namespace RIE {

struct MergeStatistics {
    size_t exactMerges{0};      // EN: Records folded by identical names / FR: Enregistrements fusionnés par nom identique
    size_t truncatedMerges{0};  // EN: Records folded as truncated variants / FR: Enregistrements fusionnés comme variantes tronquées
    size_t passes{0};           // EN: Full passes run, the last one merging nothing / FR: Passes complètes, la dernière ne fusionnant rien

    size_t totalMerges() const { return exactMerges + truncatedMerges; }
};

class DuplicateMerger {
public:
    // EN: Repeat exact then truncated merging until a pass merges nothing. Survivors keep their order.
    // FR: Répète la fusion exacte puis tronquée jusqu'à ce qu'une passe ne fusionne rien. Les survivants gardent leur ordre.
    static MergeStatistics mergeDuplicates(Dataset& dataset);

    // EN: Grouping key for truncated variants: first two words of the untagged name, empty below two words
    // FR: Clé de groupement des variantes tronquées : deux premiers mots du nom sans tag, vide sous deux mots
    static std::string groupingKey(const std::string& name);

    static bool shareGameIds(const RelicRecord& first, const RelicRecord& second);

private:
    static size_t mergeExactNames(Dataset& dataset, std::set<std::int64_t>& removed);
    static size_t mergeTruncatedNames(Dataset& dataset, std::set<std::int64_t>& removed);

    // EN: Fold the higher-id record into the lower-id one and mark it removed
    // FR: Replie l'enregistrement d'id le plus haut dans celui d'id le plus bas et le marque supprimé
    static void mergePair(RelicRecord& first, RelicRecord& second, std::set<std::int64_t>& removed);

    static void removeMarked(Dataset& dataset, const std::set<std::int64_t>& removed);
};

} // namespace RIE

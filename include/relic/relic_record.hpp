// EN: Typed relic record and the fixed faction list
// FR: Enregistrement de relique typé et liste fixe des factions

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace RIE {

// EN: The eight playable factions, in their canonical order
// FR: Les huit factions jouables, dans leur ordre canonique
enum class Nightfarer {
    WYLDER,
    GUARDIAN,
    IRONEYE,
    DUCHESS,
    RAIDER,
    REVENANT,
    RECLUSE,
    EXECUTOR
};

constexpr std::array<Nightfarer, 8> ALL_NIGHTFARERS = {
    Nightfarer::WYLDER, Nightfarer::GUARDIAN, Nightfarer::IRONEYE, Nightfarer::DUCHESS,
    Nightfarer::RAIDER, Nightfarer::REVENANT, Nightfarer::RECLUSE, Nightfarer::EXECUTOR
};

std::string nightfarerToString(Nightfarer nightfarer);
std::optional<Nightfarer> nightfarerFromString(const std::string& name);

// EN: Name of the source column that flags a faction, e.g. "allowWylder"
// FR: Nom de la colonne source qui marque une faction, ex. "allowWylder"
std::string nightfarerAllowColumn(Nightfarer nightfarer);

// EN: One curated relic entry
// FR: Une entrée de relique curée
struct RelicRecord {
    std::int64_t id{0};                      // EN: Session-unique, never exported / FR: Unique dans la session, jamais exporté
    std::set<std::int64_t> gameIds;          // EN: Sorted, deduplicated game identifiers / FR: Identifiants de jeu triés et dédupliqués
    std::string name;
    std::optional<std::string> category;
    std::optional<std::string> displayGroup;
    std::optional<std::string> levelGroup;
    std::optional<int> level;
    std::optional<bool> stacks;              // EN: "Yes"/"No" at the edit boundary / FR: "Yes"/"No" à la frontière d'édition
    int levelGroupId{0};                     // EN: Grouping key, never exported / FR: Clé de groupement, jamais exportée
    std::optional<Nightfarer> nightfarer;
    bool deep{false};
    bool debuff{false};
};

bool operator==(const RelicRecord& lhs, const RelicRecord& rhs);
bool operator!=(const RelicRecord& lhs, const RelicRecord& rhs);

} // namespace RIE

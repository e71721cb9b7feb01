// EN: Ordered record collection with the id counter and the advisory used-value sets
// FR: Collection ordonnée d'enregistrements avec le compteur d'ids et les ensembles de valeurs utilisées

#pragma once

#include "relic/relic_record.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace RIE {

// EN: Editable fields that carry a used-value set
// FR: Champs éditables qui portent un ensemble de valeurs utilisées
enum class EditableField {
    CATEGORY,
    DISPLAY_GROUP,
    LEVEL_GROUP,
    LEVEL,
    STACKS
};

// EN: Accepts both camelCase and snake_case names ("displayGroup" / "display_group")
// FR: Accepte les noms camelCase et snake_case ("displayGroup" / "display_group")
std::optional<EditableField> editableFieldFromString(const std::string& name);
std::string editableFieldToString(EditableField field);

struct Dataset {
    std::vector<RelicRecord> records;
    std::int64_t nextId{1};
    std::set<std::string> usedCategories;
    std::set<std::string> usedDisplayGroups;
    std::set<std::string> usedLevelGroups;
    std::set<std::string> usedLevels;
    std::set<std::string> usedStacks;

    std::set<std::string>& usedValues(EditableField field);
    const std::set<std::string>& usedValues(EditableField field) const;

    void clearUsedValues();
    void clear();

    RelicRecord* find(std::int64_t id);
    const RelicRecord* find(std::int64_t id) const;
};

bool operator==(const Dataset& lhs, const Dataset& rhs);

} // namespace RIE

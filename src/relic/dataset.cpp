#include "relic/dataset.hpp"
#include <algorithm>

namespace RIE {

std::optional<EditableField> editableFieldFromString(const std::string& name) {
    if (name == "category") return EditableField::CATEGORY;
    if (name == "displayGroup" || name == "display_group") return EditableField::DISPLAY_GROUP;
    if (name == "levelGroup" || name == "level_group") return EditableField::LEVEL_GROUP;
    if (name == "level") return EditableField::LEVEL;
    if (name == "stacks") return EditableField::STACKS;
    return std::nullopt;
}

std::string editableFieldToString(EditableField field) {
    switch (field) {
        case EditableField::CATEGORY:      return "category";
        case EditableField::DISPLAY_GROUP: return "displayGroup";
        case EditableField::LEVEL_GROUP:   return "levelGroup";
        case EditableField::LEVEL:         return "level";
        case EditableField::STACKS:        return "stacks";
    }
    return "";
}

std::set<std::string>& Dataset::usedValues(EditableField field) {
    return const_cast<std::set<std::string>&>(static_cast<const Dataset&>(*this).usedValues(field));
}

const std::set<std::string>& Dataset::usedValues(EditableField field) const {
    switch (field) {
        case EditableField::CATEGORY:      return usedCategories;
        case EditableField::DISPLAY_GROUP: return usedDisplayGroups;
        case EditableField::LEVEL_GROUP:   return usedLevelGroups;
        case EditableField::LEVEL:         return usedLevels;
        case EditableField::STACKS:        return usedStacks;
    }
    return usedCategories;
}

void Dataset::clearUsedValues() {
    usedCategories.clear();
    usedDisplayGroups.clear();
    usedLevelGroups.clear();
    usedLevels.clear();
    usedStacks.clear();
}

void Dataset::clear() {
    records.clear();
    nextId = 1;
    clearUsedValues();
}

RelicRecord* Dataset::find(std::int64_t id) {
    auto it = std::find_if(records.begin(), records.end(),
                           [id](const RelicRecord& record) { return record.id == id; });
    return it == records.end() ? nullptr : &*it;
}

const RelicRecord* Dataset::find(std::int64_t id) const {
    auto it = std::find_if(records.begin(), records.end(),
                           [id](const RelicRecord& record) { return record.id == id; });
    return it == records.end() ? nullptr : &*it;
}

bool operator==(const Dataset& lhs, const Dataset& rhs) {
    return lhs.records == rhs.records &&
           lhs.nextId == rhs.nextId &&
           lhs.usedCategories == rhs.usedCategories &&
           lhs.usedDisplayGroups == rhs.usedDisplayGroups &&
           lhs.usedLevelGroups == rhs.usedLevelGroups &&
           lhs.usedLevels == rhs.usedLevels &&
           lhs.usedStacks == rhs.usedStacks;
}

} // namespace RIE

#include "relic/relic_record.hpp"

namespace RIE {

std::string nightfarerToString(Nightfarer nightfarer) {
    switch (nightfarer) {
        case Nightfarer::WYLDER:   return "Wylder";
        case Nightfarer::GUARDIAN: return "Guardian";
        case Nightfarer::IRONEYE:  return "Ironeye";
        case Nightfarer::DUCHESS:  return "Duchess";
        case Nightfarer::RAIDER:   return "Raider";
        case Nightfarer::REVENANT: return "Revenant";
        case Nightfarer::RECLUSE:  return "Recluse";
        case Nightfarer::EXECUTOR: return "Executor";
    }
    return "";
}

std::optional<Nightfarer> nightfarerFromString(const std::string& name) {
    for (Nightfarer nightfarer : ALL_NIGHTFARERS) {
        if (nightfarerToString(nightfarer) == name) {
            return nightfarer;
        }
    }
    return std::nullopt;
}

std::string nightfarerAllowColumn(Nightfarer nightfarer) {
    return "allow" + nightfarerToString(nightfarer);
}

bool operator==(const RelicRecord& lhs, const RelicRecord& rhs) {
    return lhs.id == rhs.id &&
           lhs.gameIds == rhs.gameIds &&
           lhs.name == rhs.name &&
           lhs.category == rhs.category &&
           lhs.displayGroup == rhs.displayGroup &&
           lhs.levelGroup == rhs.levelGroup &&
           lhs.level == rhs.level &&
           lhs.stacks == rhs.stacks &&
           lhs.levelGroupId == rhs.levelGroupId &&
           lhs.nightfarer == rhs.nightfarer &&
           lhs.deep == rhs.deep &&
           lhs.debuff == rhs.debuff;
}

bool operator!=(const RelicRecord& lhs, const RelicRecord& rhs) {
    return !(lhs == rhs);
}

} // namespace RIE

// EN: Conversion of the dataset to the external JSON interchange array
// FR: Conversion du dataset vers le tableau JSON d'échange externe

#pragma once

#include "relic/dataset.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace RIE {

class ExportTransformer {
public:
    static constexpr int INDENT = 2;

    // EN: Keys in fixed order: ids, name, category, displayGroup, levelGroup, level, nightfarer, deep, debuff, stacks.
    //     Unset or empty values are dropped; id and levelGroupId never appear.
    // FR: Clés dans un ordre fixe : ids, name, category, displayGroup, levelGroup, level, nightfarer, deep, debuff, stacks.
    //     Les valeurs absentes ou vides sont omises ; id et levelGroupId n'apparaissent jamais.
    static nlohmann::ordered_json recordToJson(const RelicRecord& record);
    static nlohmann::ordered_json toJson(const Dataset& dataset);

    // EN: Serialized UTF-8 text with 2-space indentation, non-ASCII characters kept as is
    // FR: Texte UTF-8 sérialisé avec une indentation de 2 espaces, caractères non ASCII conservés tels quels
    static std::string toString(const Dataset& dataset);

    // EN: Throws std::runtime_error when the file cannot be written
    // FR: Lance std::runtime_error si le fichier ne peut pas être écrit
    static void writeFile(const Dataset& dataset, const std::string& path);
};

} // namespace RIE

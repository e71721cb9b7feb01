// EN: Versioned JSON project snapshot with migration of older key names
// FR: Snapshot de projet JSON versionné avec migration des anciens noms de clés

#pragma once

#include "relic/dataset.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace RIE {

struct ProjectSnapshot {
    Dataset dataset;
    std::optional<std::string> sortColumn;
    bool sortReverse{false};
};

class ProjectStore {
public:
    static constexpr const char* FORMAT_VERSION = "1.0";

    static nlohmann::ordered_json toJson(const ProjectSnapshot& snapshot);
    static std::string toString(const ProjectSnapshot& snapshot, int indent = 2);

    // EN: Write the snapshot; throws std::runtime_error on I/O failure
    // FR: Écrit le snapshot ; lance std::runtime_error en cas d'erreur d'E/S
    static void save(const ProjectSnapshot& snapshot, const std::string& path, int indent = 2);

    // EN: Read, migrate, validate and decode. ParseError for unreadable or non-JSON input,
    //     FormatError for a structurally invalid snapshot.
    // FR: Lit, migre, valide et décode. ParseError pour une entrée illisible ou non JSON,
    //     FormatError pour un snapshot structurellement invalide.
    static ProjectSnapshot load(const std::string& path);
    static ProjectSnapshot parse(const std::string& text);
    static ProjectSnapshot fromJson(nlohmann::json root);

    // EN: Rename legacy and snake_case keys to the current names in place.
    //     A legacy key overwrites its current counterpart. Returns true when anything was renamed.
    // FR: Renomme en place les clés héritées et snake_case vers les noms actuels.
    //     Une clé héritée écrase son équivalent actuel. Retourne true si quelque chose a été renommé.
    static bool migrate(nlohmann::json& root);

private:
    static RelicRecord decodeRecord(const nlohmann::json& item, size_t index);
};

} // namespace RIE

// EN: Conversion of header-keyed table rows into typed relic records
// FR: Conversion des lignes de table indexées par en-tête en enregistrements de reliques typés

#pragma once

#include "csv/streaming_parser.hpp"
#include "relic/relic_record.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace RIE {

// EN: Outcome of an import, as reported to front ends
// FR: Résultat d'un import, tel que rapporté aux interfaces
struct ImportSummary {
    size_t importedCount{0};
    size_t skippedCount{0};
};

class RecordIngestor {
public:
    struct Result {
        std::vector<RelicRecord> records;
        ImportSummary summary;
        std::int64_t rowsProcessed{0};
    };

    static constexpr const char* CHARACTER_RELIC_PREFIX = "Character Relic: ";
    static constexpr const char* RELIC_PREFIX = "Relic: ";

    // EN: Ids run from 1 and advance on every row, skipped rows included
    // FR: Les ids partent de 1 et avancent à chaque ligne, lignes ignorées comprises
    static Result ingest(const std::vector<CSV::ParsedRow>& rows);

    // EN: One row to a record; nullopt when the name lacks a relic prefix
    // FR: Une ligne vers un enregistrement ; nullopt si le nom n'a pas de préfixe de relique
    static std::optional<RelicRecord> processRow(const CSV::ParsedRow& row, std::int64_t id);

    // EN: Permissive boolean: true/1/yes/on/t/y in any case
    // FR: Booléen permissif : true/1/yes/on/t/y quelle que soit la casse
    static bool parseBool(const std::string& value);

    // EN: Game identifier made of digits only and greater than zero
    // FR: Identifiant de jeu composé uniquement de chiffres et supérieur à zéro
    static std::optional<std::int64_t> parseGameId(const std::string& value);

    // EN: Signed integer, 0 when absent or malformed
    // FR: Entier signé, 0 si absent ou malformé
    static int parseGroupId(const std::string& value);
};

} // namespace RIE

// EN: Delimited-text parser that turns a relic table export into header-keyed rows
// FR: Parser de texte délimité qui transforme un export de table de reliques en lignes indexées par en-tête

#pragma once

#include <chrono>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace RIE {
namespace CSV {

// EN: Encoding types recognised from the byte order mark
// FR: Types d'encodage reconnus via le BOM
enum class EncodingType {
    UTF8,           // EN: UTF-8 encoding / FR: Encodage UTF-8
    UTF16_LE,       // EN: UTF-16 Little Endian / FR: UTF-16 Little Endian
    UTF16_BE,       // EN: UTF-16 Big Endian / FR: UTF-16 Big Endian
    AUTO_DETECT     // EN: Automatic encoding detection / FR: Détection automatique d'encodage
};

// EN: Parser error types
// FR: Types d'erreur du parser
enum class ParserError {
    SUCCESS,                    // EN: No error / FR: Aucune erreur
    FILE_NOT_FOUND,             // EN: Input file not found / FR: Fichier d'entrée introuvable
    FILE_READ_ERROR,            // EN: Error reading file / FR: Erreur de lecture du fichier
    ENCODING_ERROR,             // EN: Unsupported encoding or invalid UTF-8 / FR: Encodage non supporté ou UTF-8 invalide
    MALFORMED_ROW,              // EN: Row parsing error / FR: Erreur de parsing de ligne
    CALLBACK_ERROR              // EN: User callback function error / FR: Erreur de fonction callback utilisateur
};

// EN: Human readable name of a parser error
// FR: Nom lisible d'une erreur du parser
std::string parserErrorToString(ParserError error);

// EN: Parser configuration options
// FR: Options de configuration du parser
struct ParserConfig {
    char delimiter{','};                    // EN: Field delimiter character / FR: Caractère délimiteur de champ
    char quote_char{'"'};                   // EN: Quote character for escaped fields / FR: Caractère de quote pour champs échappés
    bool has_header{true};                  // EN: First row is header / FR: Première ligne est l'en-tête
    bool strict_mode{false};                // EN: Fail on malformed rows instead of skipping them / FR: Échec sur lignes malformées au lieu de les ignorer
    bool trim_whitespace{true};             // EN: Trim leading/trailing whitespace / FR: Supprimer espaces en début/fin
    bool skip_empty_rows{true};             // EN: Skip empty rows / FR: Ignorer les lignes vides
    size_t max_field_size{1048576};         // EN: Maximum field size (1MB default) / FR: Taille maximum de champ (1MB par défaut)
    EncodingType encoding{EncodingType::AUTO_DETECT}; // EN: Input encoding / FR: Encodage d'entrée

    ParserConfig() = default;
};

// EN: Represents a parsed CSV row with field access methods
// FR: Représente une ligne CSV analysée avec méthodes d'accès aux champs
class ParsedRow {
public:
    ParsedRow(size_t row_number, std::vector<std::string> fields, std::vector<std::string> headers = {});

    // EN: Build a row directly from column/value pairs (rows supplied by a front end)
    // FR: Construit une ligne directement depuis des paires colonne/valeur (lignes fournies par une interface)
    static ParsedRow fromMap(size_t row_number, const std::vector<std::pair<std::string, std::string>>& columns);

    // EN: Field access by index
    // FR: Accès aux champs par index
    const std::string& operator[](size_t index) const;
    const std::string& getField(size_t index) const;
    std::optional<std::string> getFieldSafe(size_t index) const;

    // EN: Field access by header name; missing columns read as empty
    // FR: Accès aux champs par nom d'en-tête ; les colonnes absentes sont lues vides
    const std::string& operator[](const std::string& header) const;
    const std::string& getField(const std::string& header) const;
    std::optional<std::string> getFieldSafe(const std::string& header) const;

    size_t getRowNumber() const { return row_number_; }
    size_t getFieldCount() const { return fields_.size(); }
    const std::vector<std::string>& getFields() const { return fields_; }
    const std::vector<std::string>& getHeaders() const { return headers_; }
    bool hasHeaders() const { return !headers_.empty(); }
    bool hasColumn(const std::string& header) const { return header_map_.count(header) > 0; }

    bool isEmpty() const { return fields_.empty() || (fields_.size() == 1 && fields_[0].empty()); }

    // EN: A malformed row keeps its position in the table but carries no fields
    // FR: Une ligne malformée garde sa position dans la table mais ne porte aucun champ
    void markMalformed() { malformed_ = true; }
    bool isMalformed() const { return malformed_; }

    std::string toString() const;

private:
    size_t row_number_;                     // EN: 1-based physical row number / FR: Numéro de ligne physique base 1
    std::vector<std::string> fields_;       // EN: Field values / FR: Valeurs des champs
    std::vector<std::string> headers_;      // EN: Header names / FR: Noms des en-têtes
    std::unordered_map<std::string, size_t> header_map_; // EN: Header name to index mapping / FR: Mappage nom d'en-tête vers index
    bool malformed_{false};                 // EN: Dropped for an oversize field / FR: Abandonnée pour un champ trop grand

    void initializeHeaderMap();
};

// EN: Parser statistics for one parse call
// FR: Statistiques du parser pour un appel de parsing
class ParserStatistics {
public:
    ParserStatistics();

    void reset();
    void startTiming();
    void stopTiming();

    void incrementRowsParsed() { rows_parsed_++; }
    void incrementRowsSkipped() { rows_skipped_++; }
    void incrementRowsWithErrors() { rows_with_errors_++; }
    void addBytesRead(size_t bytes) { bytes_read_ += bytes; }

    size_t getRowsParsed() const { return rows_parsed_; }
    size_t getRowsSkipped() const { return rows_skipped_; }
    size_t getRowsWithErrors() const { return rows_with_errors_; }
    size_t getBytesRead() const { return bytes_read_; }
    std::chrono::duration<double> getParsingDuration() const { return parsing_duration_; }

    std::string generateReport() const;

private:
    size_t rows_parsed_{0};
    size_t rows_skipped_{0};
    size_t rows_with_errors_{0};
    size_t bytes_read_{0};
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::duration<double> parsing_duration_{0};
};

// EN: Row callback; returning false stops parsing
// FR: Callback de ligne ; retourner false arrête le parsing
using RowCallback = std::function<bool(const ParsedRow& row)>;

// EN: Error callback function type
// FR: Type de fonction callback d'erreur
using ErrorCallback = std::function<void(ParserError error, const std::string& message, size_t row_number)>;

// EN: Synchronous parser. The whole input is read and decoded before the first row callback fires,
//     so a read or encoding failure never delivers a partial table.
// FR: Parser synchrone. L'entrée est entièrement lue et décodée avant le premier callback de ligne,
//     donc une erreur de lecture ou d'encodage ne livre jamais une table partielle.
class StreamingParser {
public:
    StreamingParser();
    explicit StreamingParser(const ParserConfig& config);

    void setConfig(const ParserConfig& config) { config_ = config; }
    const ParserConfig& getConfig() const { return config_; }

    void setRowCallback(RowCallback callback) { row_callback_ = std::move(callback); }
    void setErrorCallback(ErrorCallback callback) { error_callback_ = std::move(callback); }

    // EN: Main parsing methods
    // FR: Méthodes principales de parsing
    ParserError parseFile(const std::string& file_path);
    ParserError parseStream(std::istream& stream);
    ParserError parseString(const std::string& csv_content);

    // EN: Parse everything and return the data rows (empty on failure, see last error)
    // FR: Analyse tout et retourne les lignes de données (vide en cas d'échec, voir dernière erreur)
    std::vector<ParsedRow> readAll(const std::string& csv_content);

    const std::vector<std::string>& getHeaders() const { return headers_; }
    const ParserStatistics& getStatistics() const { return stats_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }

    // EN: Utility methods
    // FR: Méthodes utilitaires
    static EncodingType detectEncoding(const std::string& content);
    static bool isValidUtf8(const std::string& content);
    static std::vector<std::string> parseRow(const std::string& row, const ParserConfig& config = ParserConfig{});
    static std::string escapeField(const std::string& field, const ParserConfig& config = ParserConfig{});

    // EN: Split content into logical records; newlines inside quotes stay in the record.
    //     A quote opens a quoted field only at the start of a field.
    // FR: Découpe le contenu en enregistrements logiques ; les sauts de ligne entre quotes restent dans l'enregistrement.
    //     Une quote n'ouvre un champ quoté qu'en début de champ.
    static std::vector<std::string> splitRecords(const std::string& content, const ParserConfig& config = ParserConfig{});

private:
    ParserConfig config_;
    RowCallback row_callback_;
    ErrorCallback error_callback_;
    ParserStatistics stats_;
    std::vector<std::string> headers_;
    std::string last_error_message_;

    ParserError parseInternal(std::string content);
    ParserError handleEncoding(std::string& content);
    ParserError processRow(const std::string& row_data, size_t row_number, bool& keep_going);

    void reportError(ParserError error, const std::string& message, size_t row_number = 0);
};

} // namespace CSV
} // namespace RIE

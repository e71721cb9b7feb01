// EN: Delimited-text parser implementation - reads the whole input, checks encoding, then emits rows
// FR: Implémentation du parser de texte délimité - lit toute l'entrée, vérifie l'encodage, puis émet les lignes

#include "csv/streaming_parser.hpp"
#include "infrastructure/logging/logger.hpp"
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace RIE {
namespace CSV {

std::string parserErrorToString(ParserError error) {
    switch (error) {
        case ParserError::SUCCESS:         return "success";
        case ParserError::FILE_NOT_FOUND:  return "file not found";
        case ParserError::FILE_READ_ERROR: return "file read error";
        case ParserError::ENCODING_ERROR:  return "encoding error";
        case ParserError::MALFORMED_ROW:   return "malformed row";
        case ParserError::CALLBACK_ERROR:  return "callback error";
    }
    return "unknown error";
}

namespace {

void trimInPlace(std::string& field) {
    size_t start = field.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        field.clear();
        return;
    }
    size_t end = field.find_last_not_of(" \t\r\n");
    field = field.substr(start, end - start + 1);
}

} // namespace

// EN: ParsedRow implementation
// FR: Implémentation de ParsedRow

ParsedRow::ParsedRow(size_t row_number, std::vector<std::string> fields, std::vector<std::string> headers)
    : row_number_(row_number), fields_(std::move(fields)), headers_(std::move(headers)) {
    initializeHeaderMap();
}

ParsedRow ParsedRow::fromMap(size_t row_number, const std::vector<std::pair<std::string, std::string>>& columns) {
    std::vector<std::string> headers;
    std::vector<std::string> fields;
    headers.reserve(columns.size());
    fields.reserve(columns.size());
    for (const auto& [header, value] : columns) {
        headers.push_back(header);
        fields.push_back(value);
    }
    return ParsedRow(row_number, std::move(fields), std::move(headers));
}

const std::string& ParsedRow::operator[](size_t index) const {
    return getField(index);
}

const std::string& ParsedRow::getField(size_t index) const {
    static const std::string empty_string;
    if (index >= fields_.size()) {
        return empty_string;
    }
    return fields_[index];
}

std::optional<std::string> ParsedRow::getFieldSafe(size_t index) const {
    if (index >= fields_.size()) {
        return std::nullopt;
    }
    return fields_[index];
}

const std::string& ParsedRow::operator[](const std::string& header) const {
    return getField(header);
}

const std::string& ParsedRow::getField(const std::string& header) const {
    static const std::string empty_string;
    auto it = header_map_.find(header);
    if (it == header_map_.end()) {
        return empty_string;
    }
    return getField(it->second);
}

std::optional<std::string> ParsedRow::getFieldSafe(const std::string& header) const {
    auto it = header_map_.find(header);
    if (it == header_map_.end()) {
        return std::nullopt;
    }
    return getFieldSafe(it->second);
}

std::string ParsedRow::toString() const {
    std::ostringstream oss;
    oss << "Row " << row_number_ << ": [";
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "\"" << fields_[i] << "\"";
    }
    oss << "]";
    return oss.str();
}

void ParsedRow::initializeHeaderMap() {
    // EN: A repeated header name resolves to its last column
    // FR: Un nom d'en-tête répété correspond à sa dernière colonne
    header_map_.clear();
    for (size_t i = 0; i < headers_.size(); ++i) {
        header_map_[headers_[i]] = i;
    }
}

// EN: ParserStatistics implementation
// FR: Implémentation de ParserStatistics

ParserStatistics::ParserStatistics() {
    reset();
}

void ParserStatistics::reset() {
    rows_parsed_ = 0;
    rows_skipped_ = 0;
    rows_with_errors_ = 0;
    bytes_read_ = 0;
    parsing_duration_ = std::chrono::duration<double>(0);
}

void ParserStatistics::startTiming() {
    start_time_ = std::chrono::steady_clock::now();
}

void ParserStatistics::stopTiming() {
    parsing_duration_ = std::chrono::steady_clock::now() - start_time_;
}

std::string ParserStatistics::generateReport() const {
    std::ostringstream report;
    report << std::fixed << std::setprecision(3);
    report << "rows parsed: " << rows_parsed_
           << ", rows skipped: " << rows_skipped_
           << ", rows with errors: " << rows_with_errors_
           << ", bytes: " << bytes_read_
           << ", duration: " << parsing_duration_.count() << "s";
    return report.str();
}

// EN: StreamingParser implementation
// FR: Implémentation de StreamingParser

StreamingParser::StreamingParser() : config_() {
}

StreamingParser::StreamingParser(const ParserConfig& config) : config_(config) {
}

ParserError StreamingParser::parseFile(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        reportError(ParserError::FILE_NOT_FOUND, "Cannot open file: " + file_path, 0);
        return ParserError::FILE_NOT_FOUND;
    }

    LOG_INFO("streaming_parser", "Starting to parse file: " + file_path);
    return parseStream(file);
}

ParserError StreamingParser::parseStream(std::istream& stream) {
    std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        reportError(ParserError::FILE_READ_ERROR, "I/O error while reading input", 0);
        return ParserError::FILE_READ_ERROR;
    }
    return parseInternal(std::move(content));
}

ParserError StreamingParser::parseString(const std::string& csv_content) {
    return parseInternal(csv_content);
}

std::vector<ParsedRow> StreamingParser::readAll(const std::string& csv_content) {
    std::vector<ParsedRow> rows;
    RowCallback previous = row_callback_;
    row_callback_ = [&rows](const ParsedRow& row) {
        rows.push_back(row);
        return true;
    };
    ParserError result = parseInternal(csv_content);
    row_callback_ = std::move(previous);
    if (result != ParserError::SUCCESS) {
        rows.clear();
    }
    return rows;
}

EncodingType StreamingParser::detectEncoding(const std::string& content) {
    // EN: Only the byte order mark is inspected; no BOM means UTF-8
    // FR: Seul le BOM est inspecté ; pas de BOM signifie UTF-8
    if (content.size() >= 2) {
        unsigned char b0 = static_cast<unsigned char>(content[0]);
        unsigned char b1 = static_cast<unsigned char>(content[1]);
        if (b0 == 0xFF && b1 == 0xFE) {
            return EncodingType::UTF16_LE;
        }
        if (b0 == 0xFE && b1 == 0xFF) {
            return EncodingType::UTF16_BE;
        }
    }
    return EncodingType::UTF8;
}

bool StreamingParser::isValidUtf8(const std::string& content) {
    size_t i = 0;
    const size_t n = content.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(content[i]);
        size_t extra = 0;
        uint32_t code_point = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= n) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(content[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }
        // EN: Reject overlong forms, surrogates and values past U+10FFFF
        // FR: Rejette les formes trop longues, les surrogates et les valeurs au-delà de U+10FFFF
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::vector<std::string> StreamingParser::parseRow(const std::string& row, const ParserConfig& config) {
    // EN: Static method to parse a single CSV record
    // FR: Méthode statique pour parser un seul enregistrement CSV
    std::vector<std::string> fields;
    if (row.empty()) {
        return fields;
    }

    size_t pos = 0;
    bool in_quotes = false;
    bool at_field_start = true;
    std::string current_field;

    while (pos < row.length()) {
        char c = row[pos];

        if (in_quotes) {
            if (c == config.quote_char) {
                if (pos + 1 < row.length() && row[pos + 1] == config.quote_char) {
                    // EN: Escaped quote within quoted field
                    // FR: Quote échappée dans un champ quoté
                    current_field += config.quote_char;
                    pos += 2;
                    continue;
                }
                in_quotes = false;
            } else {
                current_field += c;
            }
            pos++;
        } else if (c == config.quote_char && at_field_start) {
            in_quotes = true;
            at_field_start = false;
            pos++;
        } else if (c == config.delimiter) {
            if (config.trim_whitespace) {
                trimInPlace(current_field);
            }
            fields.push_back(current_field);
            current_field.clear();
            at_field_start = true;
            pos++;
        } else {
            // EN: A quote after the start of an unquoted field is a literal character
            // FR: Une quote après le début d'un champ non quoté est un caractère littéral
            current_field += c;
            if (!(config.trim_whitespace && (c == ' ' || c == '\t'))) {
                at_field_start = false;
            }
            pos++;
        }
    }

    if (config.trim_whitespace) {
        trimInPlace(current_field);
    }
    fields.push_back(current_field);

    return fields;
}

std::string StreamingParser::escapeField(const std::string& field, const ParserConfig& config) {
    bool needs_quoting = field.find(config.delimiter) != std::string::npos ||
                         field.find(config.quote_char) != std::string::npos ||
                         field.find('\n') != std::string::npos ||
                         field.find('\r') != std::string::npos;

    if (!needs_quoting) {
        return field;
    }

    std::string escaped = field;
    size_t pos = 0;
    while ((pos = escaped.find(config.quote_char, pos)) != std::string::npos) {
        escaped.insert(pos, 1, config.quote_char);
        pos += 2;
    }

    return config.quote_char + escaped + config.quote_char;
}

std::vector<std::string> StreamingParser::splitRecords(const std::string& content, const ParserConfig& config) {
    std::vector<std::string> records;
    std::string current;
    bool in_quotes = false;
    bool at_field_start = true;

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (in_quotes) {
            if (c == config.quote_char) {
                if (i + 1 < content.size() && content[i + 1] == config.quote_char) {
                    current += c;
                    ++i;
                } else {
                    in_quotes = false;
                }
            }
            current += c;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
            records.push_back(std::move(current));
            current.clear();
            at_field_start = true;
        } else {
            if (c == config.quote_char && at_field_start) {
                in_quotes = true;
                at_field_start = false;
            } else if (c == config.delimiter) {
                at_field_start = true;
            } else if (!(config.trim_whitespace && (c == ' ' || c == '\t'))) {
                at_field_start = false;
            }
            current += c;
        }
    }

    if (!current.empty()) {
        records.push_back(std::move(current));
    }
    return records;
}

// EN: Private implementation methods
// FR: Méthodes d'implémentation privées

ParserError StreamingParser::parseInternal(std::string content) {
    stats_.reset();
    stats_.startTiming();
    headers_.clear();
    last_error_message_.clear();
    stats_.addBytesRead(content.size());

    ParserError encoding_result = handleEncoding(content);
    if (encoding_result != ParserError::SUCCESS) {
        stats_.stopTiming();
        return encoding_result;
    }

    const std::vector<std::string> records = splitRecords(content, config_);

    ParserError result = ParserError::SUCCESS;
    size_t row_number = 0;
    for (const auto& record : records) {
        row_number++;

        std::string trimmed_record = record;
        trimInPlace(trimmed_record);
        if (config_.skip_empty_rows && trimmed_record.empty()) {
            stats_.incrementRowsSkipped();
            continue;
        }

        if (config_.has_header && headers_.empty()) {
            headers_ = parseRow(record, config_);
            continue;
        }

        bool keep_going = true;
        result = processRow(record, row_number, keep_going);
        if (result != ParserError::SUCCESS || !keep_going) {
            break;
        }
    }

    stats_.stopTiming();
    LOG_DEBUG("streaming_parser", "Parsing completed: " + stats_.generateReport());
    return result;
}

ParserError StreamingParser::handleEncoding(std::string& content) {
    EncodingType encoding = config_.encoding == EncodingType::AUTO_DETECT
        ? detectEncoding(content) : config_.encoding;

    if (encoding == EncodingType::UTF16_LE || encoding == EncodingType::UTF16_BE) {
        reportError(ParserError::ENCODING_ERROR, "UTF-16 input is not supported, save the table as UTF-8", 0);
        return ParserError::ENCODING_ERROR;
    }

    // EN: Drop a UTF-8 BOM so the first header name matches
    // FR: Supprime un BOM UTF-8 pour que le premier nom d'en-tête corresponde
    if (content.size() >= 3 &&
        static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF) {
        content.erase(0, 3);
    }

    if (!isValidUtf8(content)) {
        reportError(ParserError::ENCODING_ERROR, "Input is not valid UTF-8", 0);
        return ParserError::ENCODING_ERROR;
    }

    return ParserError::SUCCESS;
}

ParserError StreamingParser::processRow(const std::string& row_data, size_t row_number, bool& keep_going) {
    std::vector<std::string> fields = parseRow(row_data, config_);
    bool oversize = false;

    for (const auto& field : fields) {
        if (field.size() > config_.max_field_size) {
            stats_.incrementRowsWithErrors();
            reportError(ParserError::MALFORMED_ROW,
                        "Field exceeds " + std::to_string(config_.max_field_size) + " bytes", row_number);
            if (config_.strict_mode) {
                return ParserError::MALFORMED_ROW;
            }
            // EN: Non-strict mode hands the row on without its fields so consumers still count it
            // FR: Le mode non-strict transmet la ligne sans ses champs pour que les consommateurs la comptent
            oversize = true;
            break;
        }
    }
    if (oversize) {
        fields.clear();
    }

    ParsedRow parsed_row(row_number, std::move(fields), headers_);
    if (oversize) {
        parsed_row.markMalformed();
        stats_.incrementRowsSkipped();
    } else {
        stats_.incrementRowsParsed();
    }

    if (row_callback_) {
        try {
            keep_going = row_callback_(parsed_row);
        } catch (const std::exception& e) {
            reportError(ParserError::CALLBACK_ERROR, "Row callback failed: " + std::string(e.what()), row_number);
            return ParserError::CALLBACK_ERROR;
        }
    }

    return ParserError::SUCCESS;
}

void StreamingParser::reportError(ParserError error, const std::string& message, size_t row_number) {
    last_error_message_ = message;
    LOG_ERROR("streaming_parser", "Parser error: " + message + " (row " + std::to_string(row_number) + ")");

    if (error_callback_) {
        error_callback_(error, message, row_number);
    }
}

} // namespace CSV
} // namespace RIE

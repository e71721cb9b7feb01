#include "relic/record_ingestor.hpp"
#include "relic/text_similarity.hpp"
#include "infrastructure/logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace RIE {

namespace {

const std::vector<std::string> GAME_ID_COLUMNS = {
    "ID", "passiveSpEffectId_1", "passiveSpEffectId_2", "passiveSpEffectId_3"
};

} // namespace

RecordIngestor::Result RecordIngestor::ingest(const std::vector<CSV::ParsedRow>& rows) {
    Result result;
    std::int64_t next_id = 1;

    for (const auto& row : rows) {
        auto record = processRow(row, next_id);
        if (record) {
            result.records.push_back(std::move(*record));
            result.summary.importedCount++;
        } else {
            result.summary.skippedCount++;
            if (row.isMalformed()) {
                LOG_WARN("ingestor", "Skipping malformed row " + std::to_string(row.getRowNumber()));
            } else {
                LOG_DEBUG("ingestor", "Skipping row " + std::to_string(row.getRowNumber()) + ": name has no relic prefix");
            }
        }
        next_id++;
    }

    result.rowsProcessed = next_id - 1;
    std::unordered_map<std::string, std::string> metadata = {
        {"imported", std::to_string(result.summary.importedCount)},
        {"skipped", std::to_string(result.summary.skippedCount)}
    };
    LOG_INFO_META("ingestor", "Rows ingested", metadata);
    return result;
}

std::optional<RelicRecord> RecordIngestor::processRow(const CSV::ParsedRow& row, std::int64_t id) {
    using TextSimilarity::startsWith;

    if (row.isMalformed()) {
        return std::nullopt;
    }

    const std::string raw_name = TextSimilarity::trim(row.getField("Name"));
    RelicRecord record;
    if (startsWith(raw_name, CHARACTER_RELIC_PREFIX)) {
        record.name = raw_name.substr(std::char_traits<char>::length(CHARACTER_RELIC_PREFIX));
    } else if (startsWith(raw_name, RELIC_PREFIX)) {
        record.name = raw_name.substr(std::char_traits<char>::length(RELIC_PREFIX));
    } else {
        return std::nullopt;
    }

    record.id = id;

    for (const auto& column : GAME_ID_COLUMNS) {
        auto game_id = parseGameId(TextSimilarity::trim(row.getField(column)));
        if (game_id) {
            record.gameIds.insert(*game_id);
        }
    }

    record.debuff = parseBool(row.getField("isDebuff"));

    // EN: isNumericEffect 0 marks a deep relic
    // FR: isNumericEffect 0 désigne une relique profonde
    record.deep = TextSimilarity::trim(row.getField("isNumericEffect")) == "0";

    std::vector<Nightfarer> allowed;
    for (Nightfarer nightfarer : ALL_NIGHTFARERS) {
        if (parseBool(row.getField(nightfarerAllowColumn(nightfarer)))) {
            allowed.push_back(nightfarer);
        }
    }
    if (allowed.size() == 1) {
        record.nightfarer = allowed.front();
    }

    record.levelGroupId = parseGroupId(TextSimilarity::trim(row.getField("attachFilterParamId")));

    return record;
}

bool RecordIngestor::parseBool(const std::string& value) {
    const std::string lower = TextSimilarity::toLowerAscii(value);
    return lower == "true" || lower == "1" || lower == "yes" ||
           lower == "on" || lower == "t" || lower == "y";
}

std::optional<std::int64_t> RecordIngestor::parseGameId(const std::string& value) {
    if (value.empty() ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        std::int64_t parsed = std::stoll(value);
        if (parsed > 0) {
            return parsed;
        }
    } catch (const std::out_of_range&) {
        LOG_WARN("ingestor", "Game id out of range: " + value);
    }
    return std::nullopt;
}

int RecordIngestor::parseGroupId(const std::string& value) {
    if (value.empty()) {
        return 0;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        return consumed == value.size() ? parsed : 0;
    } catch (const std::invalid_argument&) {
        return 0;
    } catch (const std::out_of_range&) {
        return 0;
    }
}

} // namespace RIE

#include "relic/relic_session.hpp"
#include "relic/errors.hpp"
#include "relic/export_transformer.hpp"
#include "relic/name_standardizer.hpp"
#include "relic/text_similarity.hpp"
#include "infrastructure/logging/logger.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <unordered_map>

namespace RIE {

namespace {

enum class SortKind { NUMBER, BOOLEAN, GAME_IDS, TEXT };

struct SortColumn {
    std::string name;
    SortKind kind;
};

std::optional<SortColumn> resolveSortColumn(const std::string& column) {
    static const std::unordered_map<std::string, SortColumn> columns = {
        {"id", {"id", SortKind::NUMBER}},
        {"levelGroupId", {"levelGroupId", SortKind::NUMBER}},
        {"level_group_id", {"levelGroupId", SortKind::NUMBER}},
        {"level", {"level", SortKind::NUMBER}},
        {"deep", {"deep", SortKind::BOOLEAN}},
        {"debuff", {"debuff", SortKind::BOOLEAN}},
        {"stacks", {"stacks", SortKind::BOOLEAN}},
        {"gameIds", {"gameIds", SortKind::GAME_IDS}},
        {"name", {"name", SortKind::TEXT}},
        {"category", {"category", SortKind::TEXT}},
        {"displayGroup", {"displayGroup", SortKind::TEXT}},
        {"display_group", {"displayGroup", SortKind::TEXT}},
        {"levelGroup", {"levelGroup", SortKind::TEXT}},
        {"level_group", {"levelGroup", SortKind::TEXT}},
        {"nightfarer", {"nightfarer", SortKind::TEXT}}
    };
    auto it = columns.find(column);
    if (it == columns.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::int64_t numericKey(const RelicRecord& record, const std::string& column) {
    if (column == "id") return record.id;
    if (column == "levelGroupId") return record.levelGroupId;
    return record.level.value_or(0);
}

bool booleanKey(const RelicRecord& record, const std::string& column) {
    if (column == "deep") return record.deep;
    if (column == "debuff") return record.debuff;
    return record.stacks.value_or(false);
}

std::string textKey(const RelicRecord& record, const std::string& column) {
    std::string value;
    if (column == "name") value = record.name;
    else if (column == "category") value = record.category.value_or("");
    else if (column == "displayGroup") value = record.displayGroup.value_or("");
    else if (column == "levelGroup") value = record.levelGroup.value_or("");
    else if (column == "nightfarer" && record.nightfarer) value = nightfarerToString(*record.nightfarer);
    return TextSimilarity::toLowerAscii(value);
}

template<typename Key>
void stableSortBy(std::vector<RelicRecord>& records, bool reverse, Key key) {
    std::stable_sort(records.begin(), records.end(), [&](const RelicRecord& a, const RelicRecord& b) {
        return reverse ? key(b) < key(a) : key(a) < key(b);
    });
}

} // namespace

RelicSession::RelicSession() : RelicSession(SessionOptions{}) {
}

RelicSession::RelicSession(const SessionOptions& options) : options_(options) {
}

ImportSummary RelicSession::importCsvFile(const std::string& path) {
    CSV::StreamingParser parser(options_.parser);
    std::vector<CSV::ParsedRow> rows;
    parser.setRowCallback([&rows](const CSV::ParsedRow& row) {
        rows.push_back(row);
        return true;
    });

    CSV::ParserError result = parser.parseFile(path);
    if (result != CSV::ParserError::SUCCESS) {
        throw ParseError("Cannot import " + path + ": " + CSV::parserErrorToString(result) +
                         (parser.getLastErrorMessage().empty() ? "" : " (" + parser.getLastErrorMessage() + ")"));
    }

    LOG_INFO("session", "Importing " + path + " (" + parser.getStatistics().generateReport() + ")");
    return importRows(rows);
}

ImportSummary RelicSession::importCsvString(const std::string& content) {
    CSV::StreamingParser parser(options_.parser);
    std::vector<CSV::ParsedRow> rows;
    parser.setRowCallback([&rows](const CSV::ParsedRow& row) {
        rows.push_back(row);
        return true;
    });

    CSV::ParserError result = parser.parseString(content);
    if (result != CSV::ParserError::SUCCESS) {
        throw ParseError("Cannot import table: " + CSV::parserErrorToString(result) +
                         (parser.getLastErrorMessage().empty() ? "" : " (" + parser.getLastErrorMessage() + ")"));
    }
    return importRows(rows);
}

ImportSummary RelicSession::importRows(const std::vector<CSV::ParsedRow>& rows) {
    RecordIngestor::Result ingested = RecordIngestor::ingest(rows);

    Dataset imported;
    imported.records = std::move(ingested.records);
    imported.nextId = ingested.rowsProcessed + 1;
    dataset_ = std::move(imported);

    if (ingested.summary.importedCount > 0) {
        runImportPipeline();
    }

    std::unordered_map<std::string, std::string> metadata = {
        {"imported", std::to_string(ingested.summary.importedCount)},
        {"skipped", std::to_string(ingested.summary.skippedCount)},
        {"records", std::to_string(dataset_.records.size())}
    };
    LOG_INFO_META("session", "Import completed", metadata);
    return ingested.summary;
}

void RelicSession::runImportPipeline() {
    NameStandardizer::standardizeDataset(dataset_);
    if (options_.mergeEnabled) {
        DuplicateMerger::mergeDuplicates(dataset_);
    }
    if (options_.autofillEnabled) {
        GroupAutofiller(options_.autofill).autofill(dataset_);
    }
}

nlohmann::ordered_json RelicSession::exportRecords() const {
    return ExportTransformer::toJson(dataset_);
}

void RelicSession::exportToFile(const std::string& path) const {
    ExportTransformer::writeFile(dataset_, path);
}

ProjectSnapshot RelicSession::snapshot() const {
    ProjectSnapshot snapshot;
    snapshot.dataset = dataset_;
    snapshot.sortColumn = sort_column_;
    snapshot.sortReverse = sort_reverse_;
    return snapshot;
}

void RelicSession::restore(ProjectSnapshot snapshot) {
    dataset_ = std::move(snapshot.dataset);
    sort_column_ = std::move(snapshot.sortColumn);
    sort_reverse_ = snapshot.sortReverse;
}

void RelicSession::saveSnapshot(const std::string& path) const {
    ProjectStore::save(snapshot(), path, options_.snapshotIndent);
}

void RelicSession::loadSnapshot(const std::string& path) {
    // EN: Fully decoded before anything is replaced
    // FR: Entièrement décodé avant tout remplacement
    restore(ProjectStore::load(path));
}

const RelicRecord* RelicSession::findRecord(std::int64_t id) const {
    return dataset_.find(id);
}

size_t RelicSession::setField(const std::vector<std::int64_t>& ids, const std::string& field, const std::string& value) {
    auto editable = editableFieldFromString(field);
    if (!editable) {
        throw std::invalid_argument("Field is not editable: " + field);
    }

    const std::string trimmed = TextSimilarity::trim(value);
    const bool clearing = trimmed.empty();

    std::optional<int> level;
    std::optional<bool> stacks;
    std::string remembered = trimmed;
    if (!clearing && *editable == EditableField::LEVEL) {
        try {
            size_t consumed = 0;
            level = std::stoi(trimmed, &consumed);
            if (consumed != trimmed.size()) {
                throw std::invalid_argument("trailing characters");
            }
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Level must be an integer: " + trimmed);
        }
        remembered = std::to_string(*level);
    }
    if (!clearing && *editable == EditableField::STACKS) {
        const std::string lower = TextSimilarity::toLowerAscii(trimmed);
        if (lower == "yes") {
            stacks = true;
            remembered = "Yes";
        } else if (lower == "no") {
            stacks = false;
            remembered = "No";
        } else {
            throw std::invalid_argument("Stacks must be Yes or No: " + trimmed);
        }
    }

    std::optional<std::string> text;
    if (!clearing) {
        text = trimmed;
    }

    size_t updated = 0;
    for (std::int64_t id : ids) {
        RelicRecord* record = dataset_.find(id);
        if (!record) {
            LOG_DEBUG("session", "Ignoring unknown record id " + std::to_string(id));
            continue;
        }
        switch (*editable) {
            case EditableField::CATEGORY:      record->category = text; break;
            case EditableField::DISPLAY_GROUP: record->displayGroup = text; break;
            case EditableField::LEVEL_GROUP:   record->levelGroup = text; break;
            case EditableField::LEVEL:         record->level = level; break;
            case EditableField::STACKS:        record->stacks = stacks; break;
        }
        updated++;
    }

    if (!clearing) {
        dataset_.usedValues(*editable).insert(remembered);
    }

    LOG_INFO("session", "Set " + editableFieldToString(*editable) + " to '" + trimmed + "' on " +
             std::to_string(updated) + " records");
    return updated;
}

const std::set<std::string>& RelicSession::getUsedValues(const std::string& field) const {
    auto editable = editableFieldFromString(field);
    if (!editable) {
        throw std::invalid_argument("Field has no used values: " + field);
    }
    return dataset_.usedValues(*editable);
}

void RelicSession::sortBy(const std::string& column) {
    auto resolved = resolveSortColumn(column);
    if (!resolved) {
        throw std::invalid_argument("Unknown sort column: " + column);
    }

    if (sort_column_ && *sort_column_ == resolved->name) {
        sort_reverse_ = !sort_reverse_;
    } else {
        sort_column_ = resolved->name;
        sort_reverse_ = false;
    }

    const std::string& name = resolved->name;
    auto& records = dataset_.records;
    switch (resolved->kind) {
        case SortKind::NUMBER:
            stableSortBy(records, sort_reverse_, [&](const RelicRecord& r) { return numericKey(r, name); });
            break;
        case SortKind::BOOLEAN:
            stableSortBy(records, sort_reverse_, [&](const RelicRecord& r) { return booleanKey(r, name); });
            break;
        case SortKind::GAME_IDS:
            stableSortBy(records, sort_reverse_, [](const RelicRecord& r) {
                return r.gameIds.empty() ? std::int64_t{0} : *r.gameIds.begin();
            });
            break;
        case SortKind::TEXT:
            stableSortBy(records, sort_reverse_, [&](const RelicRecord& r) { return textKey(r, name); });
            break;
    }

    LOG_DEBUG("session", "Sorted by " + name + (sort_reverse_ ? " (descending)" : " (ascending)"));
}

size_t RelicSession::standardizeNames() {
    return NameStandardizer::standardizeDataset(dataset_);
}

MergeStatistics RelicSession::mergeDuplicates() {
    return DuplicateMerger::mergeDuplicates(dataset_);
}

AutofillStatistics RelicSession::autofillGroups() {
    return GroupAutofiller(options_.autofill).autofill(dataset_);
}

void RelicSession::clear() {
    dataset_.clear();
    sort_column_.reset();
    sort_reverse_ = false;
    LOG_INFO("session", "Session cleared");
}

} // namespace RIE

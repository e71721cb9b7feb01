#include "relic/project_store.hpp"
#include "relic/errors.hpp"
#include "relic/record_ingestor.hpp"
#include "relic/text_similarity.hpp"
#include "infrastructure/logging/logger.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace RIE {

namespace {

using json = nlohmann::json;

// EN: Applied in order, so "stack_id" reaches "levelGroupId" through "level_group_id"
// FR: Appliqués dans l'ordre, donc "stack_id" atteint "levelGroupId" via "level_group_id"
const std::vector<std::pair<std::string, std::string>> ROOT_RENAMES = {
    {"used_stack_groups", "used_level_groups"},
    {"next_id", "nextId"},
    {"used_categories", "usedCategories"},
    {"used_display_groups", "usedDisplayGroups"},
    {"used_level_groups", "usedLevelGroups"},
    {"used_levels", "usedLevels"},
    {"used_stacks", "usedStacks"},
    {"sort_column", "sortColumn"},
    {"sort_reverse", "sortReverse"}
};

const std::vector<std::pair<std::string, std::string>> RECORD_RENAMES = {
    {"stack_id", "level_group_id"},
    {"stack_group", "level_group"},
    {"level_group_id", "levelGroupId"},
    {"level_group", "levelGroup"},
    {"display_group", "displayGroup"}
};

bool renameKeys(json& object, const std::vector<std::pair<std::string, std::string>>& renames) {
    bool renamed = false;
    for (const auto& [from, to] : renames) {
        auto it = object.find(from);
        if (it == object.end()) {
            continue;
        }
        json value = std::move(*it);
        object.erase(from);
        object[to] = std::move(value);
        renamed = true;
    }
    return renamed;
}

std::optional<std::string> decodeText(const json& value) {
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
    if (value.is_number()) {
        return value.dump();
    }
    return std::nullopt;
}

std::optional<int> decodeInt(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        const std::string text = TextSimilarity::trim(value.get<std::string>());
        if (text.empty()) {
            return std::nullopt;
        }
        try {
            size_t consumed = 0;
            int parsed = std::stoi(text, &consumed);
            if (consumed == text.size()) {
                return parsed;
            }
            LOG_WARN("project_store", "Ignoring trailing characters in number: " + text);
        } catch (const std::logic_error& e) {
            LOG_WARN("project_store", "Ignoring non-numeric value '" + text + "': " + e.what());
        }
    }
    return std::nullopt;
}

bool decodeBool(const json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        return RecordIngestor::parseBool(value.get<std::string>());
    }
    if (value.is_number_integer()) {
        return value.get<long long>() != 0;
    }
    return false;
}

std::set<std::int64_t> decodeGameIds(const json& value) {
    std::set<std::int64_t> ids;
    if (value.is_array()) {
        for (const auto& element : value) {
            if (element.is_number_integer()) {
                ids.insert(element.get<std::int64_t>());
            } else if (element.is_string()) {
                auto parsed = RecordIngestor::parseGameId(TextSimilarity::trim(element.get<std::string>()));
                if (parsed) ids.insert(*parsed);
            }
        }
    } else if (value.is_string()) {
        // EN: Comma-separated list, as written by older projects
        // FR: Liste séparée par des virgules, telle qu'écrite par les anciens projets
        std::istringstream stream(value.get<std::string>());
        std::string piece;
        while (std::getline(stream, piece, ',')) {
            auto parsed = RecordIngestor::parseGameId(TextSimilarity::trim(piece));
            if (parsed) ids.insert(*parsed);
        }
    }
    return ids;
}

std::set<std::string> decodeUsedValues(const json& root, const char* key) {
    std::set<std::string> values;
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return values;
    }
    if (!it->is_array()) {
        throw FormatError(std::string("'") + key + "' must be an array");
    }
    for (const auto& element : *it) {
        auto text = decodeText(element);
        if (text) values.insert(*text);
    }
    return values;
}

} // namespace

nlohmann::ordered_json ProjectStore::toJson(const ProjectSnapshot& snapshot) {
    const Dataset& dataset = snapshot.dataset;
    nlohmann::ordered_json root;
    root["version"] = FORMAT_VERSION;

    nlohmann::ordered_json data = nlohmann::ordered_json::array();
    for (const auto& record : dataset.records) {
        nlohmann::ordered_json item;
        item["id"] = record.id;
        item["gameIds"] = record.gameIds;
        item["name"] = record.name;
        if (record.category) item["category"] = *record.category;
        if (record.displayGroup) item["displayGroup"] = *record.displayGroup;
        if (record.levelGroup) item["levelGroup"] = *record.levelGroup;
        if (record.level) item["level"] = *record.level;
        if (record.stacks) item["stacks"] = *record.stacks ? "Yes" : "No";
        item["levelGroupId"] = record.levelGroupId;
        if (record.nightfarer) item["nightfarer"] = nightfarerToString(*record.nightfarer);
        item["deep"] = record.deep;
        item["debuff"] = record.debuff;
        data.push_back(std::move(item));
    }
    root["data"] = std::move(data);

    root["nextId"] = dataset.nextId;
    root["usedCategories"] = dataset.usedCategories;
    root["usedDisplayGroups"] = dataset.usedDisplayGroups;
    root["usedLevelGroups"] = dataset.usedLevelGroups;
    root["usedLevels"] = dataset.usedLevels;
    root["usedStacks"] = dataset.usedStacks;
    if (snapshot.sortColumn) {
        root["sortColumn"] = *snapshot.sortColumn;
    } else {
        root["sortColumn"] = nullptr;
    }
    root["sortReverse"] = snapshot.sortReverse;
    return root;
}

std::string ProjectStore::toString(const ProjectSnapshot& snapshot, int indent) {
    return toJson(snapshot).dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

void ProjectStore::save(const ProjectSnapshot& snapshot, const std::string& path, int indent) {
    const std::string text = toString(snapshot, indent);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open project file for writing: " + path);
    }
    file << text << '\n';
    if (!file) {
        throw std::runtime_error("Failed to write project file: " + path);
    }

    LOG_INFO("project_store", "Saved " + std::to_string(snapshot.dataset.records.size()) +
             " records to " + path);
}

ProjectSnapshot ProjectStore::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ParseError("Cannot open project file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ParseError("Failed to read project file: " + path);
    }

    ProjectSnapshot snapshot = parse(text);
    LOG_INFO("project_store", "Loaded " + std::to_string(snapshot.dataset.records.size()) +
             " records from " + path);
    return snapshot;
}

ProjectSnapshot ProjectStore::parse(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("Project file is not valid JSON: ") + e.what());
    }
    return fromJson(std::move(root));
}

bool ProjectStore::migrate(json& root) {
    if (!root.is_object()) {
        return false;
    }

    bool migrated = renameKeys(root, ROOT_RENAMES);
    auto data = root.find("data");
    if (data != root.end() && data->is_array()) {
        for (auto& item : *data) {
            if (item.is_object()) {
                migrated = renameKeys(item, RECORD_RENAMES) || migrated;
            }
        }
    }
    return migrated;
}

ProjectSnapshot ProjectStore::fromJson(json root) {
    if (!root.is_object()) {
        throw FormatError("Project root must be a JSON object");
    }

    if (migrate(root)) {
        LOG_INFO("project_store", "Migrated project from an older key layout");
    }

    if (!root.contains("data") || !root.contains("nextId")) {
        throw FormatError("Not a valid project file: 'data' and 'nextId' are required");
    }
    const json& data = root["data"];
    if (!data.is_array()) {
        throw FormatError("'data' must be an array");
    }
    const json& next_id = root["nextId"];
    if (!next_id.is_number_integer()) {
        throw FormatError("'nextId' must be an integer");
    }

    ProjectSnapshot snapshot;
    Dataset& dataset = snapshot.dataset;
    std::set<std::int64_t> seen_ids;
    for (size_t i = 0; i < data.size(); ++i) {
        RelicRecord record = decodeRecord(data[i], i);
        if (!seen_ids.insert(record.id).second) {
            throw FormatError("Duplicate record id " + std::to_string(record.id));
        }
        dataset.records.push_back(std::move(record));
    }

    dataset.nextId = next_id.get<std::int64_t>();
    if (!seen_ids.empty() && dataset.nextId <= *seen_ids.rbegin()) {
        LOG_WARN("project_store", "nextId " + std::to_string(dataset.nextId) +
                 " does not exceed the highest record id, raising it");
        dataset.nextId = *seen_ids.rbegin() + 1;
    }

    dataset.usedCategories = decodeUsedValues(root, "usedCategories");
    dataset.usedDisplayGroups = decodeUsedValues(root, "usedDisplayGroups");
    dataset.usedLevelGroups = decodeUsedValues(root, "usedLevelGroups");
    dataset.usedLevels = decodeUsedValues(root, "usedLevels");
    dataset.usedStacks = decodeUsedValues(root, "usedStacks");

    auto sort_column = root.find("sortColumn");
    if (sort_column != root.end() && sort_column->is_string()) {
        snapshot.sortColumn = sort_column->get<std::string>();
    }
    auto sort_reverse = root.find("sortReverse");
    if (sort_reverse != root.end()) {
        snapshot.sortReverse = decodeBool(*sort_reverse);
    }

    return snapshot;
}

RelicRecord ProjectStore::decodeRecord(const json& item, size_t index) {
    if (!item.is_object()) {
        throw FormatError("Record " + std::to_string(index) + " is not an object");
    }

    RelicRecord record;
    auto id = item.find("id");
    if (id == item.end() || !id->is_number_integer()) {
        throw FormatError("Record " + std::to_string(index) + " has no integer 'id'");
    }
    record.id = id->get<std::int64_t>();

    auto field = [&item](const char* key) -> const json* {
        auto it = item.find(key);
        return it == item.end() || it->is_null() ? nullptr : &*it;
    };

    if (const json* value = field("gameIds")) record.gameIds = decodeGameIds(*value);
    if (const json* value = field("name")) {
        if (!value->is_string()) {
            throw FormatError("Record " + std::to_string(index) + " has a non-string 'name'");
        }
        record.name = value->get<std::string>();
    }
    if (const json* value = field("category")) record.category = decodeText(*value);
    if (const json* value = field("displayGroup")) record.displayGroup = decodeText(*value);
    if (const json* value = field("levelGroup")) record.levelGroup = decodeText(*value);
    if (const json* value = field("level")) record.level = decodeInt(*value);
    if (const json* value = field("stacks")) {
        if (value->is_boolean()) {
            record.stacks = value->get<bool>();
        } else if (value->is_string() && value->get<std::string>() == "Yes") {
            record.stacks = true;
        } else if (value->is_string() && value->get<std::string>() == "No") {
            record.stacks = false;
        }
    }
    if (const json* value = field("levelGroupId")) record.levelGroupId = decodeInt(*value).value_or(0);
    if (const json* value = field("nightfarer")) {
        auto text = decodeText(*value);
        if (text) {
            record.nightfarer = nightfarerFromString(*text);
            if (!record.nightfarer) {
                LOG_WARN("project_store", "Unknown nightfarer '" + *text + "' on record " +
                         std::to_string(record.id));
            }
        }
    }
    if (const json* value = field("deep")) record.deep = decodeBool(*value);
    if (const json* value = field("debuff")) record.debuff = decodeBool(*value);

    return record;
}

} // namespace RIE

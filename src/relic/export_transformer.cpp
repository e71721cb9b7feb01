#include "relic/export_transformer.hpp"
#include "infrastructure/logging/logger.hpp"
#include <fstream>
#include <stdexcept>

namespace RIE {

namespace {

void putOptionalString(nlohmann::ordered_json& json, const char* key, const std::optional<std::string>& value) {
    if (value && !value->empty()) {
        json[key] = *value;
    }
}

} // namespace

nlohmann::ordered_json ExportTransformer::recordToJson(const RelicRecord& record) {
    nlohmann::ordered_json json = nlohmann::ordered_json::object();

    if (!record.gameIds.empty()) {
        json["ids"] = record.gameIds;
    }
    if (!record.name.empty()) {
        json["name"] = record.name;
    }
    putOptionalString(json, "category", record.category);
    putOptionalString(json, "displayGroup", record.displayGroup);
    putOptionalString(json, "levelGroup", record.levelGroup);
    if (record.level) {
        json["level"] = *record.level;
    }
    if (record.nightfarer) {
        json["nightfarer"] = nightfarerToString(*record.nightfarer);
    }
    json["deep"] = record.deep;
    json["debuff"] = record.debuff;
    if (record.stacks) {
        json["stacks"] = *record.stacks;
    }

    return json;
}

nlohmann::ordered_json ExportTransformer::toJson(const Dataset& dataset) {
    nlohmann::ordered_json array = nlohmann::ordered_json::array();
    for (const auto& record : dataset.records) {
        array.push_back(recordToJson(record));
    }
    return array;
}

std::string ExportTransformer::toString(const Dataset& dataset) {
    return toJson(dataset).dump(INDENT, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

void ExportTransformer::writeFile(const Dataset& dataset, const std::string& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open export file for writing: " + path);
    }
    file << toString(dataset) << '\n';
    if (!file) {
        throw std::runtime_error("Failed to write export file: " + path);
    }

    LOG_INFO("export", "Exported " + std::to_string(dataset.records.size()) + " records to " + path);
}

} // namespace RIE

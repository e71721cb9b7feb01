// EN: Unit tests for project snapshots and key migration
// FR: Tests unitaires des snapshots de projet et de la migration des clés

#include <gtest/gtest.h>
#include "relic/errors.hpp"
#include "relic/project_store.hpp"
#include "infrastructure/logging/logger.hpp"
#include <filesystem>
#include <fstream>

using namespace RIE;

class ProjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        test_dir_ = std::filesystem::temp_directory_path() / "rie_project_store_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    static ProjectSnapshot sampleSnapshot() {
        ProjectSnapshot snapshot;
        RelicRecord first;
        first.id = 1;
        first.gameIds = {10, 11};
        first.name = "[Wylder] Power Strike +1";
        first.category = "Attack";
        first.displayGroup = "Wylder";
        first.levelGroup = "Power Strike";
        first.level = 2;
        first.stacks = false;
        first.levelGroupId = 7;
        first.nightfarer = Nightfarer::WYLDER;
        first.deep = true;

        RelicRecord second;
        second.id = 4;
        second.name = "Burn Resistance";
        second.debuff = true;

        snapshot.dataset.records = {first, second};
        snapshot.dataset.nextId = 6;
        snapshot.dataset.usedCategories = {"Attack", "Defense"};
        snapshot.dataset.usedDisplayGroups = {"Wylder"};
        snapshot.dataset.usedLevelGroups = {"Power Strike"};
        snapshot.dataset.usedLevels = {"2"};
        snapshot.dataset.usedStacks = {"No"};
        snapshot.sortColumn = "name";
        snapshot.sortReverse = true;
        return snapshot;
    }

    void writeFile(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ProjectStoreTest, SaveThenLoadReproducesSession) {
    ProjectSnapshot saved = sampleSnapshot();
    auto path = test_dir_ / "project.rproj";

    ProjectStore::save(saved, path.string());
    ProjectSnapshot loaded = ProjectStore::load(path.string());

    EXPECT_EQ(loaded.dataset, saved.dataset);
    EXPECT_EQ(loaded.sortColumn, saved.sortColumn);
    EXPECT_EQ(loaded.sortReverse, saved.sortReverse);
}

TEST_F(ProjectStoreTest, SnapshotLayout) {
    nlohmann::ordered_json json = ProjectStore::toJson(sampleSnapshot());

    EXPECT_EQ(json["version"], "1.0");
    EXPECT_EQ(json["nextId"], 6);
    EXPECT_EQ(json["data"][0]["stacks"], "No");
    EXPECT_EQ(json["data"][0]["levelGroupId"], 7);
    EXPECT_FALSE(json["data"][1].contains("category"));
    EXPECT_FALSE(json["data"][1].contains("stacks"));
    EXPECT_EQ(json["usedCategories"], nlohmann::ordered_json::array({"Attack", "Defense"}));

    ProjectSnapshot unsorted;
    EXPECT_TRUE(ProjectStore::toJson(unsorted)["sortColumn"].is_null());
}

TEST_F(ProjectStoreTest, LegacySnapshotMatchesModernEquivalent) {
    const std::string legacy = R"({
        "version": "1.0",
        "data": [
            {"id": 1, "gameIds": "10, 11", "name": "[Wylder] Power Strike +1", "debuff": false,
             "deep": true, "stacks": "No", "nightfarer": "Wylder", "stack_id": 7,
             "stack_group": "Power Strike", "category": "Attack", "display_group": "Wylder", "level": "2"},
            {"id": 4, "gameIds": "", "name": "Burn Resistance", "debuff": true, "deep": false,
             "stacks": "", "nightfarer": "", "stack_id": 0, "stack_group": "", "category": "",
             "display_group": "", "level": ""}
        ],
        "next_id": 6,
        "used_categories": ["Attack", "Defense"],
        "used_display_groups": ["Wylder"],
        "used_stack_groups": ["Power Strike"],
        "used_levels": ["2"],
        "used_stacks": ["No"],
        "sort_column": "name",
        "sort_reverse": true
    })";

    ProjectSnapshot loaded = ProjectStore::parse(legacy);
    ProjectSnapshot expected = sampleSnapshot();

    EXPECT_EQ(loaded.dataset, expected.dataset);
    EXPECT_EQ(loaded.sortColumn, expected.sortColumn);
    EXPECT_TRUE(loaded.sortReverse);
}

TEST_F(ProjectStoreTest, LegacyKeyOverwritesCurrentKey) {
    nlohmann::json root = nlohmann::json::parse(
        R"({"data": [{"id": 1, "stack_id": 5, "levelGroupId": 9}], "nextId": 2})");

    EXPECT_TRUE(ProjectStore::migrate(root));
    EXPECT_EQ(root["data"][0]["levelGroupId"], 5);
    EXPECT_FALSE(root["data"][0].contains("stack_id"));
}

TEST_F(ProjectStoreTest, MigrationIsIdempotent) {
    nlohmann::json root = nlohmann::json::parse(ProjectStore::toString(sampleSnapshot()));
    nlohmann::json copy = root;

    EXPECT_FALSE(ProjectStore::migrate(root));
    EXPECT_EQ(root, copy);
}

TEST_F(ProjectStoreTest, MissingRequiredKeysIsFormatError) {
    EXPECT_THROW(ProjectStore::parse(R"({"data": []})"), FormatError);
    EXPECT_THROW(ProjectStore::parse(R"({"nextId": 1})"), FormatError);
    EXPECT_THROW(ProjectStore::parse(R"([1, 2])"), FormatError);
}

TEST_F(ProjectStoreTest, StructurallyInvalidIsFormatError) {
    EXPECT_THROW(ProjectStore::parse(R"({"data": {}, "nextId": 1})"), FormatError);
    EXPECT_THROW(ProjectStore::parse(R"({"data": [42], "nextId": 1})"), FormatError);
    EXPECT_THROW(ProjectStore::parse(R"({"data": [{"name": "no id"}], "nextId": 1})"), FormatError);
    EXPECT_THROW(ProjectStore::parse(R"({"data": [{"id": 1}, {"id": 1}], "nextId": 3})"), FormatError);
    EXPECT_THROW(ProjectStore::parse(R"({"data": [], "nextId": "one"})"), FormatError);
}

TEST_F(ProjectStoreTest, InvalidJsonIsParseError) {
    EXPECT_THROW(ProjectStore::parse("{not json"), ParseError);

    auto path = test_dir_ / "broken.rproj";
    writeFile(path, "{\"data\": [");
    EXPECT_THROW(ProjectStore::load(path.string()), ParseError);
    EXPECT_THROW(ProjectStore::load((test_dir_ / "absent.rproj").string()), ParseError);
}

TEST_F(ProjectStoreTest, LenientValueDecoding) {
    ProjectSnapshot loaded = ProjectStore::parse(R"({
        "data": [{"id": 2, "gameIds": [5, "6", "junk"], "name": "A", "level": 3, "stacks": true,
                  "levelGroupId": "12", "deep": "yes", "debuff": 0}],
        "nextId": 3
    })");

    const RelicRecord& record = loaded.dataset.records.at(0);
    EXPECT_EQ(record.gameIds, (std::set<std::int64_t>{5, 6}));
    EXPECT_EQ(record.level, 3);
    EXPECT_EQ(record.stacks, true);
    EXPECT_EQ(record.levelGroupId, 12);
    EXPECT_TRUE(record.deep);
    EXPECT_FALSE(record.debuff);
    EXPECT_FALSE(loaded.sortColumn.has_value());
}

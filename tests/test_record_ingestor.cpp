// EN: Unit tests for row to record conversion
// FR: Tests unitaires de la conversion ligne vers enregistrement

#include <gtest/gtest.h>
#include "relic/record_ingestor.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace RIE;
using RIE::CSV::ParsedRow;

class RecordIngestorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    ParsedRow row(const std::vector<std::pair<std::string, std::string>>& columns) {
        return ParsedRow::fromMap(++row_number_, columns);
    }

    size_t row_number_{0};
};

TEST_F(RecordIngestorTest, RelicPrefixIsStripped) {
    auto record = RecordIngestor::processRow(row({{"Name", "Relic: Burn Resistance"}, {"isDebuff", "true"}}), 1);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "Burn Resistance");
    EXPECT_TRUE(record->debuff);
    EXPECT_EQ(record->id, 1);
}

TEST_F(RecordIngestorTest, CharacterRelicPrefixIsStripped) {
    auto record = RecordIngestor::processRow(row({{"Name", "Character Relic: Wylder: Power Strike"}}), 5);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "Wylder: Power Strike");
}

TEST_F(RecordIngestorTest, RowsWithoutPrefixAreSkipped) {
    EXPECT_FALSE(RecordIngestor::processRow(row({{"Name", "Talisman: Something"}}), 1).has_value());
    EXPECT_FALSE(RecordIngestor::processRow(row({{"Name", ""}}), 1).has_value());
    EXPECT_FALSE(RecordIngestor::processRow(row({{"ID", "10"}}), 1).has_value());
}

TEST_F(RecordIngestorTest, SkippedRowsStillAdvanceIds) {
    std::vector<ParsedRow> rows = {
        row({{"Name", "Relic: First"}}),
        row({{"Name", "Not a relic"}}),
        row({{"Name", "Relic: Third"}})
    };

    auto result = RecordIngestor::ingest(rows);

    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[0].id, 1);
    EXPECT_EQ(result.records[1].id, 3);
    EXPECT_EQ(result.summary.importedCount, 2u);
    EXPECT_EQ(result.summary.skippedCount, 1u);
    EXPECT_EQ(result.rowsProcessed, 3);
}

TEST_F(RecordIngestorTest, GameIdsArePositiveDeduplicatedAndSorted) {
    auto record = RecordIngestor::processRow(row({
        {"Name", "Relic: X"},
        {"ID", " 300 "},
        {"passiveSpEffectId_1", "0"},
        {"passiveSpEffectId_2", "-5"},
        {"passiveSpEffectId_3", "300"}
    }), 1);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->gameIds, (std::set<std::int64_t>{300}));

    record = RecordIngestor::processRow(row({
        {"Name", "Relic: Y"},
        {"ID", "200"},
        {"passiveSpEffectId_1", "abc"},
        {"passiveSpEffectId_2", "150"},
        {"passiveSpEffectId_3", "12.5"}
    }), 2);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->gameIds, (std::set<std::int64_t>{150, 200}));
}

TEST_F(RecordIngestorTest, DeepFollowsNumericEffectZero) {
    auto deep = RecordIngestor::processRow(row({{"Name", "Relic: A"}, {"isNumericEffect", " 0 "}}), 1);
    auto shallow = RecordIngestor::processRow(row({{"Name", "Relic: B"}, {"isNumericEffect", "1"}}), 2);
    auto missing = RecordIngestor::processRow(row({{"Name", "Relic: C"}}), 3);

    EXPECT_TRUE(deep->deep);
    EXPECT_FALSE(shallow->deep);
    EXPECT_FALSE(missing->deep);
}

TEST_F(RecordIngestorTest, NightfarerRequiresExactlyOneAllowColumn) {
    auto single = RecordIngestor::processRow(row({{"Name", "Relic: A"}, {"allowRaider", "TRUE"}}), 1);
    auto several = RecordIngestor::processRow(row({
        {"Name", "Relic: B"}, {"allowRaider", "1"}, {"allowRecluse", "yes"}
    }), 2);
    auto none = RecordIngestor::processRow(row({{"Name", "Relic: C"}, {"allowRaider", "0"}}), 3);

    EXPECT_EQ(single->nightfarer, Nightfarer::RAIDER);
    EXPECT_FALSE(several->nightfarer.has_value());
    EXPECT_FALSE(none->nightfarer.has_value());
}

TEST_F(RecordIngestorTest, LevelGroupIdDefaultsToZero) {
    auto parsed = RecordIngestor::processRow(row({{"Name", "Relic: A"}, {"attachFilterParamId", "7"}}), 1);
    auto bad = RecordIngestor::processRow(row({{"Name", "Relic: B"}, {"attachFilterParamId", "x7"}}), 2);
    auto absent = RecordIngestor::processRow(row({{"Name", "Relic: C"}}), 3);

    EXPECT_EQ(parsed->levelGroupId, 7);
    EXPECT_EQ(bad->levelGroupId, 0);
    EXPECT_EQ(absent->levelGroupId, 0);
}

TEST_F(RecordIngestorTest, EditableFieldsStartUnset) {
    auto record = RecordIngestor::processRow(row({{"Name", "Relic: A"}}), 1);

    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->category.has_value());
    EXPECT_FALSE(record->displayGroup.has_value());
    EXPECT_FALSE(record->levelGroup.has_value());
    EXPECT_FALSE(record->level.has_value());
    EXPECT_FALSE(record->stacks.has_value());
}

TEST_F(RecordIngestorTest, PermissiveBooleans) {
    for (const char* value : {"true", "TRUE", "1", "yes", "On", "t", "Y"}) {
        EXPECT_TRUE(RecordIngestor::parseBool(value)) << value;
    }
    for (const char* value : {"false", "0", "no", "", "2", "truthy"}) {
        EXPECT_FALSE(RecordIngestor::parseBool(value)) << value;
    }
}

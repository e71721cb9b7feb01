// EN: Unit tests for faction tag standardization
// FR: Tests unitaires de la standardisation des tags de faction

#include <gtest/gtest.h>
#include "relic/name_standardizer.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace RIE;

class NameStandardizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    RelicRecord makeRecord(std::int64_t id, const std::string& name,
                           std::optional<Nightfarer> nightfarer = std::nullopt) {
        RelicRecord record;
        record.id = id;
        record.name = name;
        record.nightfarer = nightfarer;
        return record;
    }
};

TEST_F(NameStandardizerTest, ColonFormIsBracketed) {
    EXPECT_EQ(NameStandardizer::standardize("Wylder: Power Strike"), "[Wylder] Power Strike");
}

TEST_F(NameStandardizerTest, SpaceFormIsBracketed) {
    EXPECT_EQ(NameStandardizer::standardize("Guardian Shield Up"), "[Guardian] Shield Up");
}

TEST_F(NameStandardizerTest, AlreadyBracketedIsKept) {
    EXPECT_EQ(NameStandardizer::standardize("[Ironeye] Sharp Eye"), "[Ironeye] Sharp Eye");
}

TEST_F(NameStandardizerTest, WordStartingWithTagIsNotATag) {
    EXPECT_EQ(NameStandardizer::standardize("Wylderness Walk"), "Wylderness Walk");
}

TEST_F(NameStandardizerTest, GivenTagIsPrependedWhenMissing) {
    EXPECT_EQ(NameStandardizer::standardize("Power Strike", Nightfarer::WYLDER), "[Wylder] Power Strike");
}

TEST_F(NameStandardizerTest, GivenTagOnlyMatchesItself) {
    // EN: "Raider: ..." is not rewritten when the record belongs to Duchess
    // FR: "Raider: ..." n'est pas réécrit quand l'enregistrement appartient à Duchess
    EXPECT_EQ(NameStandardizer::standardize("Raider: Dash", Nightfarer::DUCHESS), "[Duchess] Raider: Dash");
}

TEST_F(NameStandardizerTest, MismatchedBracketTagIsReplaced) {
    EXPECT_EQ(NameStandardizer::standardize("[Raider] Power Strike", Nightfarer::WYLDER), "[Wylder] Power Strike");
}

TEST_F(NameStandardizerTest, DashSpaceBecomesComma) {
    EXPECT_EQ(NameStandardizer::standardize("Fire- Ice- Wind"), "Fire, Ice, Wind");
    EXPECT_EQ(NameStandardizer::standardize("Fire-Ice"), "Fire-Ice");
}

TEST_F(NameStandardizerTest, IsIdempotent) {
    std::string once = NameStandardizer::standardize("Executor: Blade- Dance", Nightfarer::EXECUTOR);
    EXPECT_EQ(once, "[Executor] Blade, Dance");
    EXPECT_EQ(NameStandardizer::standardize(once, Nightfarer::EXECUTOR), once);
}

TEST_F(NameStandardizerTest, DatasetPassesUseOwnTagThenUntargeted) {
    Dataset dataset;
    dataset.records.push_back(makeRecord(1, "Power Strike", Nightfarer::WYLDER));
    dataset.records.push_back(makeRecord(2, "Recluse: Magic Burst"));
    dataset.records.push_back(makeRecord(3, "Plain Name"));
    dataset.records.push_back(makeRecord(4, ""));

    size_t changed = NameStandardizer::standardizeDataset(dataset);

    EXPECT_EQ(changed, 2u);
    EXPECT_EQ(dataset.records[0].name, "[Wylder] Power Strike");
    EXPECT_EQ(dataset.records[1].name, "[Recluse] Magic Burst");
    EXPECT_EQ(dataset.records[2].name, "Plain Name");
    EXPECT_EQ(dataset.records[3].name, "");
}

// EN: Unit tests for the string similarity helpers
// FR: Tests unitaires des fonctions de similarité de chaînes

#include <gtest/gtest.h>
#include "relic/text_similarity.hpp"

using namespace RIE;
using namespace RIE::TextSimilarity;

TEST(TextSimilarityTest, TrimAndSplit) {
    EXPECT_EQ(trim("  Power Strike \t"), "Power Strike");
    EXPECT_EQ(trimLeft("  a "), "a ");
    EXPECT_EQ(trimRight("  a "), "  a");
    EXPECT_EQ(splitWords("  Raises   attack power "), (std::vector<std::string>{"Raises", "attack", "power"}));
    EXPECT_TRUE(splitWords("   ").empty());
    EXPECT_EQ(joinWords({"a", "b", "c"}, 2), "a b");
}

TEST(TextSimilarityTest, BracketTags) {
    EXPECT_EQ(bracketTag("[Wylder] Power Strike"), Nightfarer::WYLDER);
    EXPECT_EQ(bracketTag("[Executor] Blade"), Nightfarer::EXECUTOR);
    EXPECT_FALSE(bracketTag("[Unknown] Thing").has_value());
    EXPECT_FALSE(bracketTag("[Wylder]NoSpace").has_value());
    EXPECT_EQ(stripBracketTag("[Guardian] Shield Up"), "Shield Up");
    EXPECT_EQ(stripBracketTag("Shield Up"), "Shield Up");
}

TEST(TextSimilarityTest, CommonPrefixNeedsSeparatorAndLength) {
    EXPECT_EQ(commonPrefix({"Fire Attack Up", "Fire Attack Down"}), "Fire Attack");
    EXPECT_EQ(commonPrefix({"Abc", "Abd"}), "");
    EXPECT_EQ(commonPrefix({"Firestorm", "Firestarter"}), "");
    EXPECT_EQ(commonPrefix({}), "");
}

TEST(TextSimilarityTest, CommonSuffixNeedsSeparatorAndLength) {
    EXPECT_EQ(commonSuffix({"Improved Fire Damage", "Greater Fire Damage"}), "Fire Damage");
    EXPECT_EQ(commonSuffix({"Strength", "Length"}), "");
}

TEST(TextSimilarityTest, CommonLeadingWords) {
    EXPECT_EQ(commonLeadingWords({"Power Strike +1", "Power Strike +2"}), "Power Strike");
    EXPECT_EQ(commonLeadingWords({"X", "X +1", "X +2"}), "X");
    EXPECT_EQ(commonLeadingWords({"Alpha Beta", "Gamma Beta"}), "");
}

TEST(TextSimilarityTest, LongestCommonSubstringStripsTrailingPlus) {
    EXPECT_EQ(longestCommonSubstring({"Attack Power +1", "Attack Power +2"}), "Attack Power");
}

TEST(TextSimilarityTest, LongestCommonSubstringIsCaseInsensitive) {
    EXPECT_EQ(longestCommonSubstring({"Boosts Attack Power", "Greatly boosts attack power"}),
              "Boosts Attack Power");
}

TEST(TextSimilarityTest, LongestCommonSubstringPrefersMostFrequentCasing) {
    std::string result = longestCommonSubstring({"X fire damage", "Y Fire Damage", "Z Fire Damage"});
    EXPECT_EQ(trim(result), "Fire Damage");
}

TEST(TextSimilarityTest, LongestCommonSubstringRejectsShortFragments) {
    EXPECT_EQ(longestCommonSubstring({"ab", "abc"}), "");
    EXPECT_EQ(longestCommonSubstring({"Fireball", "Icefire"}), "");
}

TEST(TextSimilarityTest, WordSubsequence) {
    EXPECT_TRUE(isWordSubsequence({"Raises", "attack"}, {"Raises", "physical", "attack", "power"}));
    EXPECT_FALSE(isWordSubsequence({"attack", "Raises"}, {"Raises", "physical", "attack"}));
    EXPECT_TRUE(isWordSubsequence({}, {"anything"}));
}

TEST(TextSimilarityTest, SingleWordInsertion) {
    EXPECT_TRUE(hasSingleWordInsertion({"Raises", "attack"}, {"Raises", "physical", "attack"}));
    EXPECT_TRUE(hasSingleWordInsertion({"Raises", "attack"}, {"Raises", "attack", "greatly"}));
    EXPECT_FALSE(hasSingleWordInsertion({"Raises", "attack"}, {"Lowers", "physical", "attack"}));
    EXPECT_FALSE(hasSingleWordInsertion({"a"}, {"a", "b", "c"}));
}

TEST(TextSimilarityTest, TruncatedVariants) {
    EXPECT_TRUE(isTruncatedVariant("Power Strike", "Power Strike +1"));
    EXPECT_TRUE(isTruncatedVariant("[Wylder] Power Strike", "Power Strike +1"));
    EXPECT_TRUE(isTruncatedVariant("[Wylder] Power Strike", "[Raider] Power Strike"));
    EXPECT_TRUE(isTruncatedVariant("Raises attack power", "Raises attack power permanently"));
    EXPECT_TRUE(isTruncatedVariant("Raises physical attack", "Raises attack"));
    EXPECT_TRUE(isTruncatedVariant("Raises attack", "Raises physical attack power greatly"));
    EXPECT_FALSE(isTruncatedVariant("Fire Attack Up", "Fire Attack Down"));
}

TEST(TextSimilarityTest, LengthRatioRuleIncludesOneAndAHalf) {
    EXPECT_TRUE(isTruncatedVariant("Abcdefghi", "Abcdef"));
    EXPECT_FALSE(isTruncatedVariant("Abcdefgh", "Abcdef"));
}

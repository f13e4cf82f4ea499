//! # Fuzzy Suggestion Tests

#include "vfs/fuzzy.hpp"

#include <gtest/gtest.h>

using namespace jig::vfs;

// ============================================================================
// Edit Distance
// ============================================================================

TEST(LevenshteinTest, ClassicDistances) {
    EXPECT_EQ(levenshtein_distance("kitten", "sitting"), 3u);
    EXPECT_EQ(levenshtein_distance("flaw", "lawn"), 2u);
    EXPECT_EQ(levenshtein_distance("", "abc"), 3u);
    EXPECT_EQ(levenshtein_distance("abc", ""), 3u);
}

TEST(LevenshteinTest, CaseInsensitive) {
    EXPECT_EQ(levenshtein_distance("Kitten", "KITTEN"), 0u);
}

TEST(LevenshteinTest, SubstitutionCost) {
    // A substitution costs as much as a deletion plus an insertion.
    EXPECT_EQ(levenshtein_distance("abc", "abd", 2), 2u);
    EXPECT_EQ(levenshtein_distance("abc", "abd", 1), 1u);
}

TEST(SimilarityRatioTest, Bounds) {
    EXPECT_EQ(similarity_ratio("", ""), 100);
    EXPECT_EQ(similarity_ratio("abc", "abc"), 100);
    EXPECT_EQ(similarity_ratio("abc", "xyz"), 0);
    EXPECT_EQ(similarity_ratio("kitten", "sitting"), 62);
}

// ============================================================================
// Ranking
// ============================================================================

class FuzzyMatcherTest : public ::testing::Test {
protected:
    FuzzyMatcher matcher;
    std::vector<std::string> files = {
        "com/example/Foo.java", "com/example/Fo.java", "com/example/Bar.java",
        "org/other/Thing.txt",  "example/com/Foo.java",
    };
};

TEST_F(FuzzyMatcherTest, RanksByDescendingScore) {
    auto suggestions = matcher.rank("com/example/Foo.java", files);

    ASSERT_EQ(suggestions.size(), 4u);
    EXPECT_EQ(suggestions[0], (Suggestion{"com/example/Foo.java", 100}));
    EXPECT_EQ(suggestions[1], (Suggestion{"com/example/Fo.java", 97}));
    EXPECT_EQ(suggestions[2], (Suggestion{"example/com/Foo.java", 95}));
    EXPECT_EQ(suggestions[3], (Suggestion{"com/example/Bar.java", 85}));
}

TEST_F(FuzzyMatcherTest, ThresholdDropsWeakCandidates) {
    auto suggestions = matcher.rank("Foo.jav", {"com/example/Foo.java", "Foo.java", "Bar.java"});

    ASSERT_EQ(suggestions.size(), 1u);
    EXPECT_EQ(suggestions[0].candidate, "Foo.java");
    EXPECT_EQ(suggestions[0].score, 93);
}

TEST_F(FuzzyMatcherTest, Deterministic) {
    EXPECT_EQ(matcher.rank("com/example/Fooo.java", files),
              matcher.rank("com/example/Fooo.java", files));
}

TEST_F(FuzzyMatcherTest, CapsResults) {
    FuzzyMatcher capped(FuzzyOptions{2, 75});
    auto suggestions = capped.rank("com/example/Foo.java", files);

    ASSERT_EQ(suggestions.size(), 2u);
    EXPECT_EQ(suggestions[1].candidate, "com/example/Fo.java");

    FuzzyMatcher none(FuzzyOptions{0, 75});
    EXPECT_TRUE(none.rank("com/example/Foo.java", files).empty());
}

TEST(FuzzyTieTest, TiesKeepCandidateOrder) {
    FuzzyMatcher matcher(FuzzyOptions{5, 60});
    auto suggestions = matcher.rank("abc", {"abf", "abd", "abe"});

    ASSERT_EQ(suggestions.size(), 3u);
    EXPECT_EQ(suggestions[0].candidate, "abf");
    EXPECT_EQ(suggestions[1].candidate, "abd");
    EXPECT_EQ(suggestions[2].candidate, "abe");
    EXPECT_EQ(suggestions[0].score, 67);
}

TEST(FuzzySeparatorTest, SegmentsStayDistinctFromConcatenation) {
    EXPECT_EQ(FuzzyMatcher::normalize("/a//b/"), std::string("a\0b", 3));

    FuzzyMatcher matcher;
    auto suggestions = matcher.rank("a/b", {"ab", "b/a", "a/b"});

    ASSERT_EQ(suggestions.size(), 3u);
    EXPECT_EQ(suggestions[0], (Suggestion{"a/b", 100}));
    // Reordered segments score through the token comparison.
    EXPECT_EQ(suggestions[1], (Suggestion{"b/a", 95}));
    EXPECT_EQ(suggestions[2], (Suggestion{"ab", 80}));
}

// ============================================================================
// Messages
// ============================================================================

TEST(NotFoundMessageTest, WithSuggestions) {
    auto message = not_found_message("file", "Fo.java", {{"Foo.java", 93}, {"Fox.java", 86}});
    EXPECT_EQ(message, "No file matching \"Fo.java\" was found. Maybe you meant:\n"
                       "  - Foo.java\n"
                       "  - Fox.java");
}

TEST(NotFoundMessageTest, WithoutSuggestions) {
    EXPECT_EQ(not_found_message("module", "app", {}),
              "No module matching \"app\" was found. No similar results found.");
}

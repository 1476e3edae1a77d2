#include "text/similarity.hpp"
#include <gtest/gtest.h>

using namespace diktat;

TEST(Distance, ClassicExamples) {
    EXPECT_EQ(distance("kitten", "sitting"), 3u);
    EXPECT_EQ(distance("", "abc"), 3u);
    EXPECT_EQ(distance("abc", ""), 3u);
    EXPECT_EQ(distance("", ""), 0u);
    EXPECT_EQ(distance("Hund", "Hund"), 0u);
}

TEST(Distance, CountsCodePointsNotBytes) {
    EXPECT_EQ(distance("schön", "schon"), 1u);
    EXPECT_EQ(distance("ß", "s"), 1u);
}

TEST(Distance, IsSymmetric) {
    const char* words[] = {"kitten", "sitting", "Straße", "Strasse", "", "a", "Montagmorgen", "morgen"};
    for (const char* a : words) {
        for (const char* b : words) {
            EXPECT_EQ(distance(a, b), distance(b, a)) << a << " / " << b;
        }
    }
}

TEST(Distance, TriangleInequality) {
    const char* words[] = {"Hund", "Hand", "Haus", "Maus", "Laus", "Hausmaus"};
    for (const char* a : words)
        for (const char* b : words)
            for (const char* c : words)
                EXPECT_LE(distance(a, c), distance(a, b) + distance(b, c));
}

TEST(Similarity, NotationVariantsAreEqual) {
    EXPECT_DOUBLE_EQ(similarity("schoen", "schön"), 1.0);
    EXPECT_DOUBLE_EQ(similarity("Gruesse", "grüsse"), 1.0);
}

TEST(Similarity, UmlautTyposAreBoosted) {
    // 1 - 1/5, times 1.2
    EXPECT_NEAR(similarity("schon", "schön"), 0.96, 1e-9);
    EXPECT_GE(similarity("schon", "schön"), 0.9);
    // capped
    EXPECT_DOUBLE_EQ(similarity("Madchen", "Mädchen"), 1.0);
}

TEST(Similarity, PlainWords) {
    EXPECT_NEAR(similarity("Hund", "Hand"), 0.75, 1e-9);
    EXPECT_DOUBLE_EQ(similarity("Hund", "hund"), 1.0);
    EXPECT_DOUBLE_EQ(similarity("abc", "xyz"), 0.0);
}

TEST(Similarity, StaysInRange) {
    const char* words[] = {"", "a", "Bär", "Bar", "Straße", "Strasse", "Katze", "Tisch"};
    for (const char* a : words) {
        for (const char* b : words) {
            const double s = similarity(a, b);
            EXPECT_GE(s, 0.0);
            EXPECT_LE(s, 1.0);
        }
    }
}

TEST(AreSimilar, ToleranceDependsOnLength) {
    EXPECT_TRUE(areSimilar("Hund", "Hand"));
    EXPECT_TRUE(areSimilar("Haus", "Hauser"));
    EXPECT_TRUE(areSimilar("in", "an"));
    EXPECT_FALSE(areSimilar("in", "um"));
    EXPECT_FALSE(areSimilar("Haus", "Zimmer"));
    EXPECT_TRUE(areSimilar("Schoen", "schön"));
}

TEST(AreExactlyEqual, RespectsCaseFlag) {
    EXPECT_FALSE(areExactlyEqual("Berlin", "berlin", true));
    EXPECT_TRUE(areExactlyEqual("Berlin", "berlin", false));
}

TEST(AreExactlyEqual, IgnoresNotationAndPunctuationOnly) {
    EXPECT_TRUE(areExactlyEqual("schön", "schoen", true));
    EXPECT_TRUE(areExactlyEqual("Hund.", "Hund", true));
    EXPECT_FALSE(areExactlyEqual("Hund", "Hand", false));
    EXPECT_FALSE(areExactlyEqual("schön", "schon", false));
}

TEST(CompoundSubstring, EitherDirection) {
    EXPECT_TRUE(isCompoundSubstring("morgen", "Montagmorgen"));
    EXPECT_TRUE(isCompoundSubstring("Montagmorgen", "morgen"));
    EXPECT_TRUE(isCompoundSubstring("MONTAG", "Montagmorgen"));
    EXPECT_TRUE(isCompoundSubstring("Haustuer", "Haustür"));
    EXPECT_FALSE(isCompoundSubstring("Abend", "Montagmorgen"));
    EXPECT_FALSE(isCompoundSubstring("", "Montagmorgen"));
}

TEST(SentenceCorrect, WholeSentenceAfterNormalization) {
    EXPECT_TRUE(isSentenceCorrect("Es ist schön.", "es ist schoen", false));
    EXPECT_FALSE(isSentenceCorrect("Es ist schön.", "es ist schoen", true));
    EXPECT_TRUE(isSentenceCorrect("Es ist schön.", "Es  ist schoen!", true));
    EXPECT_FALSE(isSentenceCorrect("Es ist schön.", "Es ist", false));
}

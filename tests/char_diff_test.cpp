#include "align/char_diff.hpp"
#include <gtest/gtest.h>

using namespace diktat;
using Kind = CharSegment::Kind;

namespace {

std::string kindString(const std::vector<CharSegment>& segments) {
    std::string out;
    for (const auto& s : segments) {
        switch (s.kind) {
        case Kind::Correct:     out += 'C'; break;
        case Kind::Incorrect:   out += 'I'; break;
        case Kind::Placeholder: out += 'P'; break;
        case Kind::Extra:       out += 'E'; break;
        }
    }
    return out;
}

std::string typedText(const std::vector<CharSegment>& segments) {
    std::string out;
    for (const auto& s : segments) {
        if (s.kind != Kind::Placeholder) out += s.text;
    }
    return out;
}

} // namespace

TEST(CharDiff, CompoundPartGetsPlaceholders) {
    auto segments = diffChars("Montagmorgen", "morgen", false);
    EXPECT_EQ(kindString(segments), "PPPPPPCCCCCC");
    EXPECT_EQ(renderSegments(segments), "______morgen");
}

TEST(CharDiff, CompoundPartPlaceholdersShowPunctuation) {
    auto segments = diffChars("Haus,", "Ha", false);
    EXPECT_EQ(kindString(segments), "CCPPP");
    EXPECT_EQ(renderSegments(segments), "Ha__,");
}

TEST(CharDiff, ReferenceInsideTypedWord) {
    auto segments = diffChars("Haus", "Haustür", false);
    EXPECT_EQ(kindString(segments), "CCCCEEE");
    EXPECT_EQ(renderSegments(segments), "Haustür");
}

TEST(CharDiff, EmptyInputs) {
    EXPECT_EQ(kindString(diffChars("Hund", "", false)), "PPPP");
    EXPECT_EQ(kindString(diffChars("", "ab", false)), "EE");
    EXPECT_TRUE(diffChars("", "", false).empty());
}

TEST(CharDiff, NotationVariantIsCorrect) {
    auto segments = diffChars("schön", "schoen", false);
    EXPECT_EQ(kindString(segments), "CCCCCC");
    EXPECT_EQ(renderSegments(segments), "schoen");
}

TEST(CharDiff, CaseOnlyDifference) {
    auto insensitive = diffChars("Berlin", "berlin", false);
    EXPECT_EQ(kindString(insensitive), "CCCCCC");

    auto sensitive = diffChars("Berlin", "berlin", true);
    EXPECT_EQ(kindString(sensitive), "ICCCCC");
    EXPECT_TRUE(sensitive[0].capitalizationOnly);
    EXPECT_EQ(sensitive[0].text, "b");
}

TEST(CharDiff, NotationWithCapitalizationSlip) {
    auto segments = diffChars("Schön", "schoen", true);
    EXPECT_EQ(kindString(segments), "ICCCCC");
    EXPECT_TRUE(segments[0].capitalizationOnly);
    EXPECT_FALSE(segments[3].capitalizationOnly);
    EXPECT_EQ(renderSegments(segments), "schoen");
}

TEST(CharDiff, NotationInsideCompoundPart) {
    auto segments = diffChars("Frühstück", "stueck", false);
    EXPECT_EQ(kindString(segments), "PPPPCCCCCC");
    EXPECT_EQ(renderSegments(segments), "____stueck");
}

TEST(CharDiff, NotationReferenceInsideTypedWord) {
    auto segments = diffChars("Tür", "Haustuer", false);
    EXPECT_EQ(kindString(segments), "EEEECCCC");
    EXPECT_EQ(renderSegments(segments), "Haustuer");
}

TEST(CharDiff, InnerCaseSlipIsNotCapitalization) {
    auto segments = diffChars("Berlin", "BErlin", true);
    EXPECT_EQ(kindString(segments), "CICCCC");
    EXPECT_FALSE(segments[1].capitalizationOnly);
}

TEST(CharDiff, OmittedCharacter) {
    auto segments = diffChars("Hund", "Hnd", false);
    EXPECT_EQ(kindString(segments), "CPCC");
    EXPECT_EQ(renderSegments(segments), "H_nd");
}

TEST(CharDiff, InsertedCharacter) {
    auto segments = diffChars("Hund", "Hunxd", false);
    EXPECT_EQ(kindString(segments), "CCCIC");
}

TEST(CharDiff, SubstitutedCharacterAndTrailingExtra) {
    EXPECT_EQ(kindString(diffChars("Hund", "Hand", false)), "CICC");
    EXPECT_EQ(kindString(diffChars("Hund", "Handy", false)), "CICCE");
}

TEST(CharDiff, ReferencePunctuationIsLiteral) {
    auto segments = diffChars("z.B.", "zB", false);
    EXPECT_EQ(kindString(segments), "CPCP");
    EXPECT_EQ(renderSegments(segments), "z.B.");
}

TEST(CharDiff, TypedPunctuationIsIncorrect) {
    auto segments = diffChars("Hund", "Hu-nd", false);
    EXPECT_EQ(kindString(segments), "CCICC");
}

TEST(CharDiff, NonPlaceholderSegmentsSpellTheTypedWord) {
    const std::pair<const char*, const char*> pairs[] = {
        {"Montagmorgen", "morgen"}, {"Haus", "Haustür"}, {"Hund", "Hnd"}, {"Hund", "Hunxd"},
        {"Hund", "Handy"}, {"z.B.", "zB"}, {"Straße", "Strase"}, {"Wohnung", "Whonug"},
        {"Berlin", "bErLin"}, {"schön", "schoen"}, {"Schön", "schoen"}, {"Frühstück", "stueck"},
        {"Tür", "Haustuer"}
    };
    for (const auto& [ref, cand] : pairs) {
        for (bool preserveCase : {false, true}) {
            EXPECT_EQ(typedText(diffChars(ref, cand, preserveCase)), cand) << ref << " / " << cand;
        }
    }
}

#include "align/word_aligner.hpp"
#include <gtest/gtest.h>

using namespace diktat;
using Kind = AlignmentOp::Kind;

namespace {

std::vector<Kind> kinds(const std::vector<AlignmentOp>& ops) {
    std::vector<Kind> out;
    for (const auto& op : ops) out.push_back(op.kind);
    return out;
}

// Every index used once, both sequences read back in order.
void expectValidScript(const std::vector<AlignmentOp>& ops, size_t n, size_t m) {
    size_t nextRef = 0, nextCand = 0;
    for (const auto& op : ops) {
        if (op.refIndex) {
            EXPECT_EQ(*op.refIndex, nextRef);
            ++nextRef;
        }
        if (op.candIndex) {
            EXPECT_EQ(*op.candIndex, nextCand);
            ++nextCand;
        }
        switch (op.kind) {
        case Kind::Match:
        case Kind::Substitute:
            EXPECT_TRUE(op.refIndex && op.candIndex);
            break;
        case Kind::Insert:
            EXPECT_TRUE(!op.refIndex && op.candIndex);
            break;
        case Kind::Delete:
            EXPECT_TRUE(op.refIndex && !op.candIndex);
            break;
        }
    }
    EXPECT_EQ(nextRef, n);
    EXPECT_EQ(nextCand, m);
}

} // namespace

TEST(WordAligner, EqualSequencesMatchInOrder) {
    std::vector<std::string> words{"Der", "Hund", "läuft", "schnell"};
    auto ops = alignWords(words, words, false);
    ASSERT_EQ(ops.size(), words.size());
    for (size_t i = 0; i < ops.size(); ++i) {
        EXPECT_EQ(ops[i], AlignmentOp::match(i, i));
    }
}

TEST(WordAligner, SubstitutedWord) {
    auto ops = alignWords({"Der", "Hund", "läuft", "schnell"},
                          {"Der", "Hund", "rennt", "schnell"}, false);
    EXPECT_EQ(kinds(ops), (std::vector<Kind>{Kind::Match, Kind::Match, Kind::Substitute, Kind::Match}));
    EXPECT_EQ(ops[2], AlignmentOp::substitute(2, 2));
}

TEST(WordAligner, DroppedWordIsDeleted) {
    std::vector<std::string> ref{"Ich", "gehe", "heute", "nach", "Hause"};
    std::vector<std::string> cand{"Ich", "gehe", "nach", "Hause"};
    auto ops = alignWords(ref, cand, false);
    EXPECT_EQ(ops, (std::vector<AlignmentOp>{
        AlignmentOp::match(0, 0), AlignmentOp::match(1, 1), AlignmentOp::remove(2),
        AlignmentOp::match(3, 2), AlignmentOp::match(4, 3)}));
    expectValidScript(ops, ref.size(), cand.size());
}

TEST(WordAligner, AddedWordIsInserted) {
    auto ops = alignWords({"Das", "ist", "gut"}, {"Das", "ist", "sehr", "gut"}, false);
    EXPECT_EQ(ops, (std::vector<AlignmentOp>{
        AlignmentOp::match(0, 0), AlignmentOp::match(1, 1), AlignmentOp::insert(2),
        AlignmentOp::match(2, 3)}));
}

TEST(WordAligner, EmptyInputs) {
    EXPECT_TRUE(alignWords({}, {}, false).empty());

    auto inserts = alignWords({}, {"a", "b"}, false);
    EXPECT_EQ(inserts, (std::vector<AlignmentOp>{AlignmentOp::insert(0), AlignmentOp::insert(1)}));

    auto deletes = alignWords({"a", "b"}, {}, false);
    EXPECT_EQ(deletes, (std::vector<AlignmentOp>{AlignmentOp::remove(0), AlignmentOp::remove(1)}));
}

TEST(WordAligner, PrefersTheCloserWordForSubstitution) {
    // Katze/Lampe share two letters, Katze/Tisch none.
    auto ops = alignWords({"Katze"}, {"Tisch", "Lampe"}, false);
    EXPECT_EQ(ops, (std::vector<AlignmentOp>{AlignmentOp::insert(0), AlignmentOp::substitute(0, 1)}));
}

TEST(WordAligner, TiesPairEarliestWords) {
    auto ops = alignWords({"Katze"}, {"Tisch", "Tisch"}, false);
    EXPECT_EQ(ops, (std::vector<AlignmentOp>{AlignmentOp::substitute(0, 0), AlignmentOp::insert(1)}));
}

TEST(WordAligner, CaseFlagDecidesMatchOrSubstitute) {
    EXPECT_EQ(alignWords({"Berlin"}, {"berlin"}, false),
              (std::vector<AlignmentOp>{AlignmentOp::match(0, 0)}));
    EXPECT_EQ(alignWords({"Berlin"}, {"berlin"}, true),
              (std::vector<AlignmentOp>{AlignmentOp::substitute(0, 0)}));
}

TEST(WordAligner, NotationVariantsMatch) {
    auto ops = alignWords({"Es", "ist", "schön"}, {"es", "ist", "schoen"}, false);
    EXPECT_EQ(kinds(ops), (std::vector<Kind>{Kind::Match, Kind::Match, Kind::Match}));
}

TEST(WordAligner, ScriptIsOrderPreserving) {
    std::vector<std::string> ref{"Am", "Montagmorgen", "fährt", "der", "Bus", "nicht", "pünktlich"};
    std::vector<std::string> cand{"am", "Montag", "morgen", "fährt", "Bus", "nich", "puenktlich", "ab"};
    auto ops = alignWords(ref, cand, false);
    expectValidScript(ops, ref.size(), cand.size());
}

TEST(WordAligner, CountOps) {
    auto ops = alignWords({"Ich", "gehe", "heute", "nach", "Hause"},
                          {"Ich", "ging", "nach", "Hause", "jetzt"}, false);
    auto counts = countOps(ops);
    EXPECT_EQ(counts.matches + counts.substitutions + counts.deletions, 5u);
    EXPECT_EQ(counts.matches + counts.substitutions + counts.insertions, 5u);
    EXPECT_EQ(counts.matches, 3u);

    EXPECT_EQ(countOps({}).matches, 0u);
}

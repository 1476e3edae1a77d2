#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace diktat {

// One step of a word-level edit script. Match and Substitute carry both
// indices, Insert only a candidate index, Delete only a reference index.
struct AlignmentOp {
    enum class Kind { Match, Substitute, Insert, Delete };

    Kind kind;
    std::optional<std::size_t> refIndex;
    std::optional<std::size_t> candIndex;

    static AlignmentOp match(std::size_t ref, std::size_t cand) { return {Kind::Match, ref, cand}; }
    static AlignmentOp substitute(std::size_t ref, std::size_t cand) { return {Kind::Substitute, ref, cand}; }
    static AlignmentOp insert(std::size_t cand) { return {Kind::Insert, std::nullopt, cand}; }
    static AlignmentOp remove(std::size_t ref) { return {Kind::Delete, ref, std::nullopt}; }

    bool operator==(const AlignmentOp&) const = default;
};

struct AlignmentCounts {
    std::size_t matches = 0;
    std::size_t substitutions = 0;
    std::size_t insertions = 0;
    std::size_t deletions = 0;
};

// Minimum-cost edit script between the reference and the typed words.
//
// Costs: 0 for a word pair that areExactlyEqual(), 1 - similarity() for any
// other pair, 1 for an inserted or deleted word. The table is filled from
// the end of both sequences and read from the front, so among equal-cost
// scripts the one that pairs words earliest wins; at each step a pairing is
// preferred over a Delete, and a Delete over an Insert.
//
// O(n*m) time and memory; meant for completed sentences and exercises, not
// for every keystroke.
std::vector<AlignmentOp> alignWords(const std::vector<std::string>& referenceWords,
                                    const std::vector<std::string>& candidateWords,
                                    bool preserveCase);

AlignmentCounts countOps(const std::vector<AlignmentOp>& ops);

} // namespace diktat

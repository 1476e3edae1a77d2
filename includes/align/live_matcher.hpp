#pragma once

#include "align/char_diff.hpp"
#include "text/normalizer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace diktat {

// Tuning of the live matcher. The defaults are empirical; they are kept as
// data so a config file can override them.
struct LiveMatchParams {
    std::size_t window = 5;                     // unconsumed typed words searched per reference word
    double acceptanceThreshold = 0.38;          // best score must exceed this
    double correctThreshold = 0.9;              // at or above: candidate for Correct
    double earlyStopScore = 0.95;               // stop scanning the window above this
    double positionPenalty = 0.03;              // per lookahead step, case-insensitive mode
    double positionPenaltyCaseSensitive = 0.01; // per lookahead step, case-sensitive mode
    double penaltyFloor = 0.4;                  // penalties only apply above, and never go below, this
    double compoundScore = 0.85;                // typed word is part of a compound, or vice versa
    std::size_t minCompoundPartLength = 3;
    double minCompoundPartRatio = 0.3;
    double functionWordScore = 0.95;            // case slip on a short function word
};

struct WordJudgment {
    enum class Kind { Correct, Partial, Missing, Extra };

    Kind kind;
    std::optional<std::size_t> refIndex;
    std::optional<std::size_t> candIndex;
    std::optional<std::string> refWord;
    std::optional<std::string> candWord;
    double score = 0.0;                         // after the position penalty
    std::vector<CharSegment> charSegments;      // Partial only
};

// Scores one typed word against one reference word, before any position
// penalty. Exposed for diagnostics and tests.
double scoreCandidate(const std::string& referenceWord,
                      const std::string& candidateWord,
                      bool preserveCase,
                      const LiveMatchParams& params = {});

// Causal word matcher for text that is still being typed.
//
// Walks the reference words in order. For each one the next `window`
// unconsumed typed words are scored and the best (after a penalty that grows
// with the lookahead distance) is taken if it beats the acceptance
// threshold; typed words skipped to reach it become Extra. A reference word
// without an acceptable match is Missing and consumes nothing, so a dropped
// word does not derail the rest of the sentence. Typed words left at the end
// are Extra.
//
// A word is Correct only when it also passes areExactlyEqual(), so the live
// view and the statistics never disagree about what is correct.
std::vector<WordJudgment> matchLive(const std::vector<std::string>& referenceWords,
                                    const std::vector<std::string>& candidateWords,
                                    bool preserveCase,
                                    const LiveMatchParams& params = {});

// Byte range of a typed word in the typed text.
struct ErrorSpan {
    std::size_t offset = 0;
    std::size_t length = 0;

    bool operator==(const ErrorSpan&) const = default;
};

// Ranges of every typed word that is not judged Correct, in text order.
// `candidateTokens` must be the tokens the judgments were computed from.
std::vector<ErrorSpan> errorSpans(const std::vector<Token>& candidateTokens,
                                  const std::vector<WordJudgment>& judgments);

} // namespace diktat

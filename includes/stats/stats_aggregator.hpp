#pragma once

#include "align/word_aligner.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace diktat {

struct SentenceStats {
    std::size_t index = 0;
    std::size_t referenceWords = 0;
    std::size_t typedWords = 0;
    std::size_t correctWords = 0;     // strict, one typed word per reference word
    bool attempted = false;
    bool solved = false;              // whole sentence equal after normalization
};

struct ExerciseStats {
    std::size_t totalSentences = 0;
    std::size_t completedSentences = 0;
    std::size_t solvedSentences = 0;

    std::size_t totalWords = 0;       // reference words of the whole exercise
    std::size_t attemptedWords = 0;   // typed words of attempted sentences
    std::size_t correctWords = 0;
    std::size_t incorrectWords = 0;   // attempted - correct; omissions are not mistakes

    double completionPercent = 0.0;   // attempted / total
    double accuracyPercent = 0.0;     // correct / total
    double mistakePercent = 0.0;      // incorrect / attempted

    AlignmentCounts alignment;        // global alignment of all words
    std::vector<SentenceStats> sentences;
};

// Number of typed words that claim a distinct, strictly equal reference
// word. Each typed word takes the first unclaimed reference word it equals.
std::size_t countStrictlyCorrect(const std::vector<std::string>& referenceWords,
                                 const std::vector<std::string>& typedWords,
                                 bool preserveCase);

// Folds the per-sentence results of an exercise into statistics.
// `answers[i]` is the final typed text of sentence i, or nullopt when the
// sentence was not attempted; missing trailing entries count as not
// attempted. The global alignment runs over all reference words against the
// typed words of the attempted sentences.
ExerciseStats aggregateStats(const std::vector<std::string>& referenceSentences,
                             const std::vector<std::optional<std::string>>& answers,
                             bool preserveCase);

// Same, reusing a global alignment the caller already computed over the
// same words.
ExerciseStats aggregateStats(const std::vector<std::string>& referenceSentences,
                             const std::vector<std::optional<std::string>>& answers,
                             bool preserveCase,
                             const std::vector<AlignmentOp>& alignment);

} // namespace diktat

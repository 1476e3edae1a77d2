#include "stats/stats_aggregator.hpp"
#include "text/normalizer.hpp"
#include "text/similarity.hpp"

namespace diktat {

namespace {

double percent(std::size_t part, std::size_t whole) {
    if (whole == 0) return 0.0;
    return static_cast<double>(part) * 100.0 / static_cast<double>(whole);
}

SentenceStats sentenceStats(std::size_t index,
                            const std::vector<std::string>& referenceWords,
                            const std::optional<std::string>& answer,
                            bool preserveCase,
                            const std::string& referenceSentence) {
    SentenceStats s{.index = index, .referenceWords = referenceWords.size()};
    if (!answer) return s;

    const auto typed = splitWords(*answer);
    s.attempted = true;
    s.typedWords = typed.size();
    s.correctWords = countStrictlyCorrect(referenceWords, typed, preserveCase);
    s.solved = isSentenceCorrect(referenceSentence, *answer, preserveCase);
    return s;
}

} // namespace

std::size_t countStrictlyCorrect(const std::vector<std::string>& referenceWords,
                                 const std::vector<std::string>& typedWords,
                                 bool preserveCase) {
    std::vector<bool> claimed(referenceWords.size(), false);
    std::size_t correct = 0;
    for (const auto& typed : typedWords) {
        for (std::size_t i = 0; i < referenceWords.size(); ++i) {
            if (claimed[i]) continue;
            if (areExactlyEqual(typed, referenceWords[i], preserveCase)) {
                claimed[i] = true;
                ++correct;
                break;
            }
        }
    }
    return correct;
}

ExerciseStats aggregateStats(const std::vector<std::string>& referenceSentences,
                             const std::vector<std::optional<std::string>>& answers,
                             bool preserveCase) {
    std::vector<std::string> allReference;
    std::vector<std::string> allTyped;
    for (std::size_t i = 0; i < referenceSentences.size(); ++i) {
        const auto referenceWords = splitWords(referenceSentences[i]);
        allReference.insert(allReference.end(), referenceWords.begin(), referenceWords.end());
        if (i < answers.size() && answers[i]) {
            const auto typed = splitWords(*answers[i]);
            allTyped.insert(allTyped.end(), typed.begin(), typed.end());
        }
    }
    return aggregateStats(referenceSentences, answers, preserveCase,
                          alignWords(allReference, allTyped, preserveCase));
}

ExerciseStats aggregateStats(const std::vector<std::string>& referenceSentences,
                             const std::vector<std::optional<std::string>>& answers,
                             bool preserveCase,
                             const std::vector<AlignmentOp>& alignment) {
    ExerciseStats stats;
    stats.totalSentences = referenceSentences.size();
    stats.sentences.reserve(referenceSentences.size());

    for (std::size_t i = 0; i < referenceSentences.size(); ++i) {
        const auto referenceWords = splitWords(referenceSentences[i]);
        const std::optional<std::string> answer = i < answers.size() ? answers[i] : std::nullopt;

        SentenceStats s = sentenceStats(i, referenceWords, answer, preserveCase, referenceSentences[i]);

        stats.totalWords += s.referenceWords;
        if (s.attempted) {
            ++stats.completedSentences;
            if (s.solved) ++stats.solvedSentences;
            stats.attemptedWords += s.typedWords;
            stats.correctWords += s.correctWords;
        }
        stats.sentences.push_back(s);
    }

    stats.incorrectWords = stats.attemptedWords - stats.correctWords;
    stats.completionPercent = percent(stats.attemptedWords, stats.totalWords);
    stats.accuracyPercent = percent(stats.correctWords, stats.totalWords);
    stats.mistakePercent = percent(stats.incorrectWords, stats.attemptedWords);
    stats.alignment = countOps(alignment);
    return stats;
}

} // namespace diktat

#include "align/live_matcher.hpp"
#include "text/normalizer.hpp"
#include "text/similarity.hpp"
#include "text/utf8.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace diktat {

namespace {

// Scores for a word that differs from the reference only in letter case
// (case-sensitive mode).
constexpr double kCaseSlipScore = 0.95;
constexpr double kFirstLetterSlipScore = 0.75;

// Similar spellings land in [base, base + span].
constexpr double kSimilarBaseCaseSensitive = 0.6;
constexpr double kSimilarSpanCaseSensitive = 0.3;
constexpr double kSimilarBase = 0.5;
constexpr double kSimilarSpan = 0.4;

// Short words that are too common to be judged by substring or spelling
// closeness.
constexpr std::array<std::string_view, 7> kFunctionWords = {
    "in", "ihr", "ist", "es", "der", "die", "das"
};

bool isFunctionWord(const std::string& normalizedLower) {
    return std::find(kFunctionWords.begin(), kFunctionWords.end(), normalizedLower) != kFunctionWords.end();
}

double closeness(const std::u32string& a, const std::u32string& b) {
    const size_t longer = std::max(a.size(), b.size());
    if (longer == 0) return 1.0;
    return 1.0 - static_cast<double>(diktat::distance(a, b)) / static_cast<double>(longer);
}

// Share of positions holding the same character.
double positionalOverlap(const std::u32string& a, const std::u32string& b) {
    const size_t longer = std::max(a.size(), b.size());
    if (longer == 0) return 0.0;
    const size_t shorter = std::min(a.size(), b.size());
    size_t same = 0;
    for (size_t k = 0; k < shorter; ++k) {
        if (a[k] == b[k]) ++same;
    }
    return static_cast<double>(same) / static_cast<double>(longer);
}

bool isCompoundPart(const std::string& refLower, const std::string& candLower, const LiveMatchParams& params) {
    if (refLower == candLower) return false;
    if (isFunctionWord(refLower) || isFunctionWord(candLower)) return false;
    if (!isCompoundSubstring(candLower, refLower)) return false;

    const size_t refLen = utf8::decode(refLower).size();
    const size_t candLen = utf8::decode(candLower).size();
    const size_t shorter = std::min(refLen, candLen);
    const size_t longer = std::max(refLen, candLen);
    return shorter >= params.minCompoundPartLength &&
           static_cast<double>(shorter) / static_cast<double>(longer) >= params.minCompoundPartRatio;
}

WordJudgment missing(const std::vector<std::string>& referenceWords, size_t i) {
    return WordJudgment{
        .kind = WordJudgment::Kind::Missing,
        .refIndex = i,
        .refWord = referenceWords[i]
    };
}

WordJudgment extra(const std::vector<std::string>& candidateWords, size_t j) {
    return WordJudgment{
        .kind = WordJudgment::Kind::Extra,
        .candIndex = j,
        .candWord = candidateWords[j]
    };
}

} // namespace

double scoreCandidate(const std::string& referenceWord,
                      const std::string& candidateWord,
                      bool preserveCase,
                      const LiveMatchParams& params) {
    const std::string ref = normalize(referenceWord, preserveCase);
    const std::string cand = normalize(candidateWord, preserveCase);
    const std::string refLower = normalize(referenceWord, false);
    const std::string candLower = normalize(candidateWord, false);
    const std::u32string ur = utf8::decode(ref);
    const std::u32string uc = utf8::decode(cand);

    double score = 0.0;
    if (ref == cand) {
        score = 1.0;
    } else if (preserveCase) {
        if (refLower == candLower) {
            const bool firstLetterSlip = !ur.empty() && !uc.empty() &&
                                         utf8::isUpper(ur.front()) && !utf8::isUpper(uc.front());
            score = firstLetterSlip ? kFirstLetterSlipScore : kCaseSlipScore;
        } else if (areSimilar(ref, cand)) {
            score = kSimilarBaseCaseSensitive + kSimilarSpanCaseSensitive * closeness(ur, uc);
        }
    }

    if (score < 0.9 && isCompoundPart(refLower, candLower, params)) {
        score = params.compoundScore;
    }

    if (score < 0.8 && areSimilar(ref, cand)) {
        score = kSimilarBase + kSimilarSpan * closeness(ur, uc);
    } else if (score < 0.5) {
        score = positionalOverlap(ur, uc);
    }

    if (score < 0.8 && isFunctionWord(refLower) && refLower == candLower) {
        score = params.functionWordScore;
    }
    return score;
}

std::vector<WordJudgment> matchLive(const std::vector<std::string>& referenceWords,
                                    const std::vector<std::string>& candidateWords,
                                    bool preserveCase,
                                    const LiveMatchParams& params) {
    std::vector<WordJudgment> judgments;
    judgments.reserve(referenceWords.size() + candidateWords.size());

    const double penaltyPerStep = preserveCase ? params.positionPenaltyCaseSensitive : params.positionPenalty;
    size_t next = 0; // first unconsumed typed word

    for (size_t i = 0; i < referenceWords.size(); ++i) {
        if (next >= candidateWords.size()) {
            judgments.push_back(missing(referenceWords, i));
            continue;
        }

        const size_t span = std::min(params.window, candidateWords.size() - next);
        std::optional<size_t> best;
        double bestScore = -1.0;
        double bestRawScore = 0.0;

        for (size_t j = 0; j < span; ++j) {
            const double raw = scoreCandidate(referenceWords[i], candidateWords[next + j], preserveCase, params);
            double score = raw;
            if (score > params.penaltyFloor) {
                score = std::max(params.penaltyFloor, score - static_cast<double>(j) * penaltyPerStep);
            }
            if (score > bestScore) {
                bestScore = score;
                bestRawScore = raw;
                best = next + j;
            }
            if (score > params.earlyStopScore) break;
        }

        if (!best || bestScore <= params.acceptanceThreshold) {
            judgments.push_back(missing(referenceWords, i));
            continue;
        }

        for (size_t k = next; k < *best; ++k) {
            judgments.push_back(extra(candidateWords, k));
        }

        const std::string& ref = referenceWords[i];
        const std::string& cand = candidateWords[*best];
        // The position penalty picks the match; it does not make an exact word less correct.
        const bool correct = bestRawScore >= params.correctThreshold && areExactlyEqual(ref, cand, preserveCase);

        judgments.push_back(WordJudgment{
            .kind = correct ? WordJudgment::Kind::Correct : WordJudgment::Kind::Partial,
            .refIndex = i,
            .candIndex = *best,
            .refWord = ref,
            .candWord = cand,
            .score = bestScore,
            .charSegments = correct ? std::vector<CharSegment>{} : diffChars(ref, cand, preserveCase)
        });
        next = *best + 1;
    }

    for (size_t k = next; k < candidateWords.size(); ++k) {
        judgments.push_back(extra(candidateWords, k));
    }
    return judgments;
}

std::vector<ErrorSpan> errorSpans(const std::vector<Token>& candidateTokens,
                                  const std::vector<WordJudgment>& judgments) {
    std::vector<bool> correct(candidateTokens.size(), false);
    for (const auto& j : judgments) {
        if (j.kind == WordJudgment::Kind::Correct && j.candIndex && *j.candIndex < correct.size()) {
            correct[*j.candIndex] = true;
        }
    }

    std::vector<ErrorSpan> spans;
    for (size_t k = 0; k < candidateTokens.size(); ++k) {
        if (correct[k]) continue;
        spans.push_back(ErrorSpan{candidateTokens[k].offset, candidateTokens[k].length});
    }
    return spans;
}

} // namespace diktat

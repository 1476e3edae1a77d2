#pragma once

#include "align/live_matcher.hpp"
#include "align/word_aligner.hpp"
#include "stats/stats_aggregator.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace diktat {

class Exercise;

// Word-level feedback for one sentence of an exercise.
struct SentenceFeedback {
    std::size_t index = 0;
    std::string reference;
    std::optional<std::string> answer;   // nullopt: not attempted
    std::vector<WordJudgment> judgments;
    std::vector<ErrorSpan> errors;       // byte ranges in *answer
};

SentenceFeedback evaluateSentence(std::size_t index,
                                  const std::string& reference,
                                  const std::optional<std::string>& answer,
                                  bool preserveCase,
                                  const LiveMatchParams& params = {});

// Everything the CLI reports for a finished exercise.
struct ExerciseReport {
    std::string exerciseId;
    std::string title;
    bool preserveCase = false;
    std::vector<SentenceFeedback> sentences;
    std::vector<std::string> referenceWords;   // all sentences
    std::vector<std::string> typedWords;       // attempted sentences
    std::vector<AlignmentOp> alignment;
    ExerciseStats stats;
};

ExerciseReport buildReport(const Exercise& exercise,
                           const std::vector<std::optional<std::string>>& answers,
                           bool preserveCase,
                           const LiveMatchParams& params = {});

std::string toString(AlignmentOp::Kind kind);
std::string toString(WordJudgment::Kind kind);
std::string toString(CharSegment::Kind kind);

void to_json(nlohmann::json& j, const AlignmentOp& op);
void to_json(nlohmann::json& j, const CharSegment& segment);
void to_json(nlohmann::json& j, const WordJudgment& judgment);
void to_json(nlohmann::json& j, const ErrorSpan& span);
void to_json(nlohmann::json& j, const AlignmentCounts& counts);
void to_json(nlohmann::json& j, const SentenceStats& stats);
void to_json(nlohmann::json& j, const ExerciseStats& stats);
void to_json(nlohmann::json& j, const SentenceFeedback& feedback);
void to_json(nlohmann::json& j, const ExerciseReport& report);

} // namespace diktat

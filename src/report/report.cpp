#include "report/report.hpp"
#include "exercise/exercise.hpp"
#include "text/normalizer.hpp"

namespace diktat {

namespace {

template <typename T>
nlohmann::json optionalValue(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

SentenceFeedback evaluateSentence(std::size_t index,
                                  const std::string& reference,
                                  const std::optional<std::string>& answer,
                                  bool preserveCase,
                                  const LiveMatchParams& params) {
    SentenceFeedback feedback{.index = index, .reference = reference, .answer = answer};
    if (!answer) return feedback;

    const auto tokens = tokenize(*answer);
    std::vector<std::string> typed;
    typed.reserve(tokens.size());
    for (const auto& t : tokens) typed.push_back(t.text);

    feedback.judgments = matchLive(splitWords(reference), typed, preserveCase, params);
    feedback.errors = errorSpans(tokens, feedback.judgments);
    return feedback;
}

ExerciseReport buildReport(const Exercise& exercise,
                           const std::vector<std::optional<std::string>>& answers,
                           bool preserveCase,
                           const LiveMatchParams& params) {
    ExerciseReport report{
        .exerciseId = exercise.getId(),
        .title = exercise.getTitle(),
        .preserveCase = preserveCase
    };

    const auto sentences = exercise.getSentenceTexts();
    for (std::size_t i = 0; i < sentences.size(); ++i) {
        const std::optional<std::string> answer = i < answers.size() ? answers[i] : std::nullopt;
        report.sentences.push_back(evaluateSentence(i, sentences[i], answer, preserveCase, params));

        const auto refWords = splitWords(sentences[i]);
        report.referenceWords.insert(report.referenceWords.end(), refWords.begin(), refWords.end());
        if (answer) {
            const auto typed = splitWords(*answer);
            report.typedWords.insert(report.typedWords.end(), typed.begin(), typed.end());
        }
    }

    report.alignment = alignWords(report.referenceWords, report.typedWords, preserveCase);
    report.stats = aggregateStats(sentences, answers, preserveCase, report.alignment);
    return report;
}

std::string toString(AlignmentOp::Kind kind) {
    switch (kind) {
    case AlignmentOp::Kind::Match:      return "match";
    case AlignmentOp::Kind::Substitute: return "substitute";
    case AlignmentOp::Kind::Insert:     return "insert";
    case AlignmentOp::Kind::Delete:     return "delete";
    }
    return "unknown";
}

std::string toString(WordJudgment::Kind kind) {
    switch (kind) {
    case WordJudgment::Kind::Correct: return "correct";
    case WordJudgment::Kind::Partial: return "partial";
    case WordJudgment::Kind::Missing: return "missing";
    case WordJudgment::Kind::Extra:   return "extra";
    }
    return "unknown";
}

std::string toString(CharSegment::Kind kind) {
    switch (kind) {
    case CharSegment::Kind::Correct:     return "correct";
    case CharSegment::Kind::Incorrect:   return "incorrect";
    case CharSegment::Kind::Placeholder: return "placeholder";
    case CharSegment::Kind::Extra:       return "extra";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const AlignmentOp& op) {
    j = nlohmann::json{
        {"kind", toString(op.kind)},
        {"ref_index", optionalValue(op.refIndex)},
        {"cand_index", optionalValue(op.candIndex)}
    };
}

void to_json(nlohmann::json& j, const CharSegment& segment) {
    j = nlohmann::json{
        {"kind", toString(segment.kind)},
        {"text", segment.text}
    };
    if (segment.capitalizationOnly) j["capitalization_only"] = true;
}

void to_json(nlohmann::json& j, const WordJudgment& judgment) {
    j = nlohmann::json{
        {"kind", toString(judgment.kind)},
        {"ref_index", optionalValue(judgment.refIndex)},
        {"cand_index", optionalValue(judgment.candIndex)},
        {"ref_word", optionalValue(judgment.refWord)},
        {"cand_word", optionalValue(judgment.candWord)},
        {"score", judgment.score}
    };
    if (judgment.kind == WordJudgment::Kind::Partial) {
        j["segments"] = judgment.charSegments;
    }
}

void to_json(nlohmann::json& j, const ErrorSpan& span) {
    j = nlohmann::json{{"offset", span.offset}, {"length", span.length}};
}

void to_json(nlohmann::json& j, const AlignmentCounts& counts) {
    j = nlohmann::json{
        {"matches", counts.matches},
        {"substitutions", counts.substitutions},
        {"insertions", counts.insertions},
        {"deletions", counts.deletions}
    };
}

void to_json(nlohmann::json& j, const SentenceStats& stats) {
    j = nlohmann::json{
        {"index", stats.index},
        {"reference_words", stats.referenceWords},
        {"typed_words", stats.typedWords},
        {"correct_words", stats.correctWords},
        {"attempted", stats.attempted},
        {"solved", stats.solved}
    };
}

void to_json(nlohmann::json& j, const ExerciseStats& stats) {
    j = nlohmann::json{
        {"total_sentences", stats.totalSentences},
        {"completed_sentences", stats.completedSentences},
        {"solved_sentences", stats.solvedSentences},
        {"total_words", stats.totalWords},
        {"attempted_words", stats.attemptedWords},
        {"correct_words", stats.correctWords},
        {"incorrect_words", stats.incorrectWords},
        {"completion_percent", stats.completionPercent},
        {"accuracy_percent", stats.accuracyPercent},
        {"mistake_percent", stats.mistakePercent},
        {"alignment", stats.alignment},
        {"sentences", stats.sentences}
    };
}

void to_json(nlohmann::json& j, const SentenceFeedback& feedback) {
    j = nlohmann::json{
        {"index", feedback.index},
        {"reference", feedback.reference},
        {"answer", optionalValue(feedback.answer)},
        {"words", feedback.judgments},
        {"errors", feedback.errors}
    };
}

void to_json(nlohmann::json& j, const ExerciseReport& report) {
    j = nlohmann::json{
        {"exercise", report.exerciseId},
        {"title", report.title},
        {"preserve_case", report.preserveCase},
        {"sentences", report.sentences},
        {"alignment", report.alignment},
        {"stats", report.stats}
    };
}

} // namespace diktat

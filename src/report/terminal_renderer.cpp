#include "report/terminal_renderer.hpp"
#include "text/utf8.hpp"
#include <iomanip>

namespace diktat {

namespace {

constexpr const char* kGreen = "32";
constexpr const char* kRed = "31";
constexpr const char* kYellow = "33";
constexpr const char* kDim = "2";
constexpr const char* kStrike = "9;31";
constexpr const char* kUnderline = "4;31";
constexpr const char* kBold = "1";

const char* colorFor(CharSegment::Kind kind) {
    switch (kind) {
    case CharSegment::Kind::Correct:     return kGreen;
    case CharSegment::Kind::Incorrect:   return kRed;
    case CharSegment::Kind::Placeholder: return kDim;
    case CharSegment::Kind::Extra:       return kUnderline;
    }
    return kDim;
}

} // namespace

std::string TerminalRenderer::paint(const std::string& text, const char* code) const {
    if (!color_) return text;
    return std::string("\033[") + code + "m" + text + "\033[0m";
}

std::string TerminalRenderer::formatSegments(const std::vector<CharSegment>& segments) const {
    std::string out;
    for (const auto& s : segments) out += paint(s.text, colorFor(s.kind));
    return out;
}

std::string TerminalRenderer::formatWord(const WordJudgment& judgment) const {
    switch (judgment.kind) {
    case WordJudgment::Kind::Correct:
        return paint(judgment.candWord.value_or(""), kGreen);
    case WordJudgment::Kind::Partial:
        return color_ ? formatSegments(judgment.charSegments)
                      : judgment.candWord.value_or("") + "~";
    case WordJudgment::Kind::Missing:
        return color_ ? paint(std::string(utf8::decode(judgment.refWord.value_or("")).size(), kPlaceholderGlyph), kDim)
                      : "[" + judgment.refWord.value_or("") + "]";
    case WordJudgment::Kind::Extra:
        return color_ ? paint(judgment.candWord.value_or(""), kStrike)
                      : "+" + judgment.candWord.value_or("");
    }
    return {};
}

void TerminalRenderer::renderLive(const std::vector<WordJudgment>& judgments) {
    std::string line;
    for (const auto& j : judgments) {
        if (!line.empty()) line += ' ';
        line += formatWord(j);
    }
    if (color_) out_ << "\r\033[K";
    out_ << line;
    out_ << (color_ ? "" : "\n") << std::flush;
}

void TerminalRenderer::renderSentence(const SentenceFeedback& feedback) {
    out_ << paint("#" + std::to_string(feedback.index + 1), kBold) << " " << feedback.reference << "\n";
    if (!feedback.answer) {
        out_ << "   " << paint("Not attempted", kYellow) << "\n";
        return;
    }

    std::string line;
    for (const auto& j : feedback.judgments) {
        if (!line.empty()) line += ' ';
        line += formatWord(j);
    }
    out_ << "   " << line << "\n";

    for (const auto& j : feedback.judgments) {
        if (j.kind != WordJudgment::Kind::Partial) continue;
        out_ << "     " << j.refWord.value_or("") << " <- " << j.candWord.value_or("")
             << "  " << formatSegments(j.charSegments)
             << "  (" << std::fixed << std::setprecision(2) << j.score << ")\n";
    }
}

void TerminalRenderer::renderAlignment(const std::vector<std::string>& referenceWords,
                                       const std::vector<std::string>& typedWords,
                                       const std::vector<AlignmentOp>& ops) {
    out_ << paint("Alignment:", kBold) << "\n";
    for (const auto& op : ops) {
        const std::string ref = op.refIndex ? referenceWords[*op.refIndex] : "";
        const std::string typed = op.candIndex ? typedWords[*op.candIndex] : "";
        switch (op.kind) {
        case AlignmentOp::Kind::Match:
            out_ << "  " << paint("= " + ref, kGreen) << "\n";
            break;
        case AlignmentOp::Kind::Substitute:
            out_ << "  " << paint("~ " + ref + " -> " + typed, kYellow) << "\n";
            break;
        case AlignmentOp::Kind::Insert:
            out_ << "  " << paint("+ " + typed, kRed) << "\n";
            break;
        case AlignmentOp::Kind::Delete:
            out_ << "  " << paint("- " + ref, kDim) << "\n";
            break;
        }
    }
}

void TerminalRenderer::renderStats(const ExerciseStats& stats) {
    out_ << paint("=== Results ===", kBold) << "\n";
    out_ << std::fixed << std::setprecision(0);
    out_ << "Sentences:  " << stats.completedSentences << " / " << stats.totalSentences
         << " attempted, " << stats.solvedSentences << " solved\n";
    out_ << "Completion: " << stats.completionPercent << "% ("
         << stats.attemptedWords << " / " << stats.totalWords << " words)\n";
    out_ << "Accuracy:   " << stats.accuracyPercent << "% ("
         << stats.correctWords << " / " << stats.totalWords << " words correct)\n";
    out_ << "Mistakes:   " << stats.mistakePercent << "% ("
         << stats.incorrectWords << " / " << stats.attemptedWords << ")\n";
    out_ << "Alignment:  " << stats.alignment.matches << " matched, "
         << stats.alignment.substitutions << " substituted, "
         << stats.alignment.insertions << " inserted, "
         << stats.alignment.deletions << " deleted\n";
    out_ << std::flush;
}

void TerminalRenderer::renderReport(const ExerciseReport& report) {
    out_ << paint("=== " + report.title + " ===", kBold) << "\n";
    for (const auto& s : report.sentences) renderSentence(s);
    out_ << "\n";
    renderAlignment(report.referenceWords, report.typedWords, report.alignment);
    out_ << "\n";
    renderStats(report.stats);
}

} // namespace diktat

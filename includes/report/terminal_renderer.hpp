#pragma once

#include "report/report.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace diktat {

// Coloured plain-text rendering of feedback (ANSI escapes, disabled with
// color = false).
class TerminalRenderer {
public:
    explicit TerminalRenderer(std::ostream& out = std::cout, bool color = true)
        : out_(out)
        , color_(color)
    {}

    // Typed words coloured by judgment, with character diffs under partial words.
    void renderSentence(const SentenceFeedback& feedback);

    // One line of live feedback; rewritten in place on a terminal.
    void renderLive(const std::vector<WordJudgment>& judgments);

    void renderAlignment(const std::vector<std::string>& referenceWords,
                         const std::vector<std::string>& typedWords,
                         const std::vector<AlignmentOp>& ops);

    void renderStats(const ExerciseStats& stats);

    void renderReport(const ExerciseReport& report);

    std::string formatWord(const WordJudgment& judgment) const;
    std::string formatSegments(const std::vector<CharSegment>& segments) const;

private:
    std::ostream& out_;
    const bool color_;

    std::string paint(const std::string& text, const char* code) const;
};

} // namespace diktat

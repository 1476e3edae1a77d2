#pragma once

#include <string>
#include <vector>

namespace diktat {

// Glyph shown for a reference letter the learner has not typed.
inline constexpr char kPlaceholderGlyph = '_';

struct CharSegment {
    enum class Kind { Correct, Incorrect, Placeholder, Extra };

    Kind kind;
    std::string text;                 // one UTF-8 encoded character
    bool capitalizationOnly = false;  // Incorrect only because of a first-letter case slip

    bool operator==(const CharSegment&) const = default;
};

// Explains a matched-but-imperfect word pair character by character.
//
// Correct, Incorrect and Extra segments carry typed characters in typed
// order; Placeholder segments stand in for reference characters that were
// not typed (punctuation is shown as itself instead of the glyph). Tried in
// order, all but the last on notation-folded forms:
//  - equal after normalization: every typed character is Correct
//  - equal ignoring case: case slips are Incorrect when preserveCase
//  - typed word inside the reference (compound part): placeholders around
//    the overlap
//  - reference inside the typed word: Extra around the overlap
//  - otherwise a forward scan that re-synchronizes within 3 characters
std::vector<CharSegment> diffChars(const std::string& referenceWord,
                                   const std::string& candidateWord,
                                   bool preserveCase);

// Concatenated text of all segments.
std::string renderSegments(const std::vector<CharSegment>& segments);

} // namespace diktat

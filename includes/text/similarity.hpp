#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace diktat {

// Multiplier applied to similarity() when either word involves an umlaut or
// one of its ASCII notations. The result is capped at 1.0.
inline constexpr double kUmlautBoost = 1.2;

// Levenshtein distance over code points (unit cost insert/delete/substitute).
// Compares the strings as given; callers normalize first when they need to.
std::size_t distance(std::string_view a, std::string_view b);
std::size_t distance(std::u32string_view a, std::u32string_view b);

// 1.0 for normalized-equal words, otherwise 1 - distance / longer length on
// the case-folded normalized forms, boosted for umlaut notations.
double similarity(std::string_view a, std::string_view b);

// Normalized-equal, or within 1 edit (words of up to 3 letters) or 2 edits.
bool areSimilar(std::string_view a, std::string_view b);

// Equality after normalization, nothing else. The only comparison used for
// "strictly correct" words.
bool areExactlyEqual(std::string_view a, std::string_view b, bool preserveCase);

// One word's case-folded normalized form occurs inside the other's.
bool isCompoundSubstring(std::string_view small, std::string_view big);

// Whole typed sentence equals the reference after normalization.
bool isSentenceCorrect(std::string_view reference, std::string_view candidate, bool preserveCase);

} // namespace diktat

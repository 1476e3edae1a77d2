#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace diktat {

struct NormalizationOptions {
    bool preserveCase = false;      // keep letter case for exact comparison
    bool stripPunctuation = true;   // drop everything but letters, digits, whitespace
};

// Canonical form used for every comparison:
//  1. ASCII notations are folded into the umlaut they stand for
//     (ae/a:/a/ -> ä, oe/o:/o/ -> ö, ue/u:/u/ -> ü, s/ -> ß), case-insensitively,
//     the case of the base vowel deciding the case of the result
//  2. punctuation is stripped (optional)
//  3. whitespace runs collapse to one space, ends are trimmed
//  4. lowercased unless preserveCase
// Idempotent and total.
std::string normalize(std::string_view text, const NormalizationOptions& options = {});

inline std::string normalize(std::string_view text, bool preserveCase) {
    return normalize(text, NormalizationOptions{.preserveCase = preserveCase});
}

// Step 1 of normalize on its own, remembering where each folded character
// came from: sources[i] is the index in the input of the first code point
// behind text[i]. A folded notation covers two input code points.
struct FoldedText {
    std::u32string text;
    std::vector<std::size_t> sources;
};

FoldedText foldNotationsTracked(std::u32string_view in);

// True if the raw word carries an umlaut, a sharp s, or one of the ASCII
// notations for them.
bool hasAlternateNotation(std::string_view word);

// One whitespace-delimited word of a text. offset/length are in bytes of
// the source text, so callers can highlight the typed span.
struct Token {
    std::string text;
    std::size_t offset = 0;
    std::size_t length = 0;
};

std::vector<Token> tokenize(std::string_view text);
std::vector<std::string> splitWords(std::string_view text);

} // namespace diktat

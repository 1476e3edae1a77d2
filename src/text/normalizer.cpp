#include "text/normalizer.hpp"
#include "text/utf8.hpp"

#include <cctype>

namespace diktat {

namespace {

char32_t umlautFor(char32_t base) {
    switch (base) {
    case U'a': return U'ä';
    case U'o': return U'ö';
    case U'u': return U'ü';
    case U'A': return U'Ä';
    case U'O': return U'Ö';
    case U'U': return U'Ü';
    default:   return 0;
    }
}

bool isNotationMark(char32_t c) {
    return c == U'e' || c == U'E' || c == U':' || c == U'/';
}

std::u32string foldNotations(std::u32string_view in) {
    return foldNotationsTracked(in).text;
}

std::u32string stripPunctuation(std::u32string_view in) {
    std::u32string out;
    out.reserve(in.size());
    for (char32_t c : in) {
        if (!utf8::isPunct(c)) out.push_back(c);
    }
    return out;
}

std::u32string collapseSpaces(std::u32string_view in) {
    std::u32string out;
    out.reserve(in.size());
    bool inSpace = false;
    for (char32_t c : in) {
        if (utf8::isSpace(c)) {
            if (!inSpace && !out.empty()) out.push_back(U' ');
            inSpace = true;
        } else {
            out.push_back(c);
            inSpace = false;
        }
    }
    if (!out.empty() && out.back() == U' ') out.pop_back();
    return out;
}

} // namespace

// Single left-to-right pass. Replacements never produce a base vowel or
// an 's', so the output contains no foldable pair.
FoldedText foldNotationsTracked(std::u32string_view in) {
    FoldedText out;
    out.text.reserve(in.size());
    out.sources.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        out.sources.push_back(i);
        char32_t c = in[i];
        if (i + 1 < in.size()) {
            char32_t next = in[i + 1];
            char32_t umlaut = umlautFor(c);
            if (umlaut && isNotationMark(next)) {
                out.text.push_back(umlaut);
                ++i;
                continue;
            }
            if ((c == U's' || c == U'S') && next == U'/') {
                out.text.push_back(U'ß');
                ++i;
                continue;
            }
        }
        out.text.push_back(c);
    }
    return out;
}

std::string normalize(std::string_view text, const NormalizationOptions& options) {
    std::u32string s = foldNotations(utf8::decode(text));

    if (options.stripPunctuation) {
        std::u32string stripped = stripPunctuation(s);
        // "a.e" becomes "ae" once the dot is gone; fold again so that a
        // second normalization finds nothing left to do.
        if (stripped.size() != s.size()) {
            s = foldNotations(stripped);
        }
    }

    s = collapseSpaces(s);

    if (!options.preserveCase) {
        s = utf8::toLower(s);
    }
    return utf8::encode(s);
}

bool hasAlternateNotation(std::string_view word) {
    std::u32string s = utf8::toLower(utf8::decode(word));
    for (size_t i = 0; i < s.size(); ++i) {
        char32_t c = s[i];
        if (c == U'ä' || c == U'ö' || c == U'ü' || c == U'ß') return true;
        if (i + 1 < s.size()) {
            char32_t next = s[i + 1];
            if (umlautFor(c) && isNotationMark(next)) return true;
            if (c == U's' && next == U'/') return true;
        }
    }
    return false;
}

std::vector<Token> tokenize(std::string_view text) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i >= text.size()) break;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        tokens.push_back(Token{
            .text = std::string(text.substr(start, i - start)),
            .offset = start,
            .length = i - start
        });
    }
    return tokens;
}

std::vector<std::string> splitWords(std::string_view text) {
    std::vector<std::string> words;
    for (auto& token : tokenize(text)) {
        words.push_back(std::move(token.text));
    }
    return words;
}

} // namespace diktat

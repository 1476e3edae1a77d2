#include "align/char_diff.hpp"
#include "text/normalizer.hpp"
#include "text/utf8.hpp"

#include <utility>

namespace diktat {

namespace {

using Kind = CharSegment::Kind;

// How far the scan looks ahead to re-synchronize after a mismatch.
constexpr size_t kLookAhead = 3;

CharSegment segment(Kind kind, char32_t c, bool capitalizationOnly = false) {
    return CharSegment{kind, utf8::encode(c), capitalizationOnly};
}

// Un-typed reference character. Punctuation is shown as itself.
CharSegment placeholderFor(char32_t refChar) {
    if (utf8::isPunct(refChar)) return segment(Kind::Placeholder, refChar);
    return CharSegment{Kind::Placeholder, std::string(1, kPlaceholderGlyph)};
}

bool sameChar(char32_t a, char32_t b, bool preserveCase) {
    return preserveCase ? a == b : utf8::toLower(a) == utf8::toLower(b);
}

// A word with its notations folded. Every folded character maps back to
// the one or two raw characters it was written with.
struct FoldedWord {
    std::u32string raw;
    FoldedText folded;
    std::u32string lower;

    explicit FoldedWord(std::u32string word)
        : raw(std::move(word)), folded(foldNotationsTracked(raw)), lower(utf8::toLower(folded.text)) {}

    size_t size() const { return folded.text.size(); }
    char32_t at(size_t i) const { return folded.text[i]; }

    std::u32string_view rawAt(size_t i) const {
        const size_t begin = folded.sources[i];
        const size_t end = i + 1 < folded.sources.size() ? folded.sources[i + 1] : raw.size();
        return std::u32string_view(raw).substr(begin, end - begin);
    }
};

void pushTyped(std::vector<CharSegment>& out, Kind kind, std::u32string_view typed,
               bool capitalizationOnly = false) {
    for (char32_t c : typed) {
        out.push_back(segment(kind, c, capitalizationOnly));
        capitalizationOnly = false;
    }
}

void pushPlaceholders(std::vector<CharSegment>& out, std::u32string_view ref) {
    for (char32_t c : ref) out.push_back(placeholderFor(c));
}

std::vector<CharSegment> diffCaseOnly(const FoldedWord& ref, const FoldedWord& cand, bool preserveCase) {
    std::vector<CharSegment> out;
    out.reserve(cand.raw.size());
    for (size_t i = 0; i < cand.size(); ++i) {
        if (!preserveCase || ref.at(i) == cand.at(i)) {
            pushTyped(out, Kind::Correct, cand.rawAt(i));
        } else {
            const bool firstLetterSlip = i == 0 && utf8::isUpper(ref.at(i)) && utf8::isLower(cand.at(i));
            pushTyped(out, Kind::Incorrect, cand.rawAt(i), firstLetterSlip);
        }
    }
    return out;
}

// Typed word found at refStart inside the reference.
std::vector<CharSegment> diffCandidateInside(const FoldedWord& ref, const FoldedWord& cand,
                                             size_t refStart, bool preserveCase) {
    std::vector<CharSegment> out;
    out.reserve(ref.raw.size());
    for (size_t i = 0; i < refStart; ++i) pushPlaceholders(out, ref.rawAt(i));
    for (size_t k = 0; k < cand.size(); ++k) {
        const bool ok = sameChar(ref.at(refStart + k), cand.at(k), preserveCase);
        pushTyped(out, ok ? Kind::Correct : Kind::Incorrect, cand.rawAt(k));
    }
    for (size_t i = refStart + cand.size(); i < ref.size(); ++i) pushPlaceholders(out, ref.rawAt(i));
    return out;
}

// Reference found at candStart inside the typed word.
std::vector<CharSegment> diffReferenceInside(const FoldedWord& ref, const FoldedWord& cand,
                                             size_t candStart, bool preserveCase) {
    std::vector<CharSegment> out;
    out.reserve(cand.raw.size());
    for (size_t i = 0; i < candStart; ++i) pushTyped(out, Kind::Extra, cand.rawAt(i));
    for (size_t k = 0; k < ref.size(); ++k) {
        const bool ok = sameChar(ref.at(k), cand.at(candStart + k), preserveCase);
        pushTyped(out, ok ? Kind::Correct : Kind::Incorrect, cand.rawAt(candStart + k));
    }
    for (size_t i = candStart + ref.size(); i < cand.size(); ++i) pushTyped(out, Kind::Extra, cand.rawAt(i));
    return out;
}

std::vector<CharSegment> diffScan(const std::u32string& ref, const std::u32string& cand, bool preserveCase) {
    std::vector<CharSegment> out;
    out.reserve(ref.size() + cand.size());

    size_t e = 0, a = 0;
    while (e < ref.size()) {
        const char32_t ce = ref[e];

        // Reference punctuation needs the exact character.
        if (utf8::isPunct(ce)) {
            if (a < cand.size() && cand[a] == ce) {
                out.push_back(segment(Kind::Correct, ce));
                ++a;
            } else {
                out.push_back(segment(Kind::Placeholder, ce));
            }
            ++e;
            continue;
        }

        if (a >= cand.size()) {
            out.push_back(placeholderFor(ce));
            ++e;
            continue;
        }

        const char32_t ca = cand[a];
        if (utf8::isPunct(ca)) {
            out.push_back(segment(Kind::Incorrect, ca));
            ++a;
            continue;
        }

        if (sameChar(ce, ca, preserveCase)) {
            out.push_back(segment(Kind::Correct, ca));
            ++e;
            ++a;
            continue;
        }

        bool realigned = false;

        // Garbled or inserted characters before the expected one.
        for (size_t k = 1; k <= kLookAhead && a + k < cand.size(); ++k) {
            if (sameChar(ce, cand[a + k], preserveCase)) {
                for (size_t j = 0; j < k; ++j) out.push_back(segment(Kind::Incorrect, cand[a + j]));
                a += k;
                realigned = true;
                break;
            }
        }

        // Omitted reference characters.
        if (!realigned) {
            for (size_t k = 1; k <= kLookAhead && e + k < ref.size(); ++k) {
                if (sameChar(ref[e + k], ca, preserveCase)) {
                    for (size_t j = 0; j < k; ++j) out.push_back(placeholderFor(ref[e + j]));
                    e += k;
                    realigned = true;
                    break;
                }
            }
        }

        if (!realigned) {
            out.push_back(segment(Kind::Incorrect, ca));
            ++a;
            ++e;
        }
    }

    while (a < cand.size()) out.push_back(segment(Kind::Extra, cand[a++]));
    return out;
}

} // namespace

std::vector<CharSegment> diffChars(const std::string& referenceWord,
                                   const std::string& candidateWord,
                                   bool preserveCase) {
    const std::u32string ref = utf8::decode(referenceWord);
    const std::u32string cand = utf8::decode(candidateWord);

    if (cand.empty()) {
        std::vector<CharSegment> out;
        for (char32_t c : ref) out.push_back(placeholderFor(c));
        return out;
    }
    if (ref.empty()) {
        std::vector<CharSegment> out;
        for (char32_t c : cand) out.push_back(segment(Kind::Extra, c));
        return out;
    }

    // Same word written with a notation ("schoen" for "schön").
    const NormalizationOptions keepPunct{.preserveCase = preserveCase, .stripPunctuation = false};
    if (normalize(referenceWord, keepPunct) == normalize(candidateWord, keepPunct)) {
        std::vector<CharSegment> out;
        out.reserve(cand.size());
        for (char32_t c : cand) out.push_back(segment(Kind::Correct, c));
        return out;
    }

    // The remaining special cases compare notation-folded forms, so "Schön"
    // against "schoen" is a case slip and "stueck" a part of "Frühstück".
    const FoldedWord refFolded(ref);
    const FoldedWord candFolded(cand);

    if (refFolded.lower == candFolded.lower) {
        return diffCaseOnly(refFolded, candFolded, preserveCase);
    }

    if (auto pos = refFolded.lower.find(candFolded.lower); pos != std::u32string::npos) {
        return diffCandidateInside(refFolded, candFolded, pos, preserveCase);
    }

    if (auto pos = candFolded.lower.find(refFolded.lower); pos != std::u32string::npos) {
        return diffReferenceInside(refFolded, candFolded, pos, preserveCase);
    }

    return diffScan(ref, cand, preserveCase);
}

std::string renderSegments(const std::vector<CharSegment>& segments) {
    std::string out;
    for (const auto& s : segments) out += s.text;
    return out;
}

} // namespace diktat

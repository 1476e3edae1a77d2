#include "text/similarity.hpp"
#include "text/normalizer.hpp"
#include "text/utf8.hpp"

#include <algorithm>
#include <vector>

namespace diktat {

std::size_t distance(std::u32string_view a, std::u32string_view b) {
    // Keep the row as short as the shorter input.
    if (a.size() < b.size()) std::swap(a, b);
    const size_t n = a.size(), m = b.size();

    std::vector<size_t> prev(m + 1), cur(m + 1);
    for (size_t j = 0; j <= m; ++j) prev[j] = j;
    for (size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= m; ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({ prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost });
        }
        prev.swap(cur);
    }
    return prev[m];
}

std::size_t distance(std::string_view a, std::string_view b) {
    return diktat::distance(utf8::decode(a), utf8::decode(b));
}

double similarity(std::string_view a, std::string_view b) {
    auto na = utf8::decode(normalize(a, false));
    auto nb = utf8::decode(normalize(b, false));
    if (na == nb) return 1.0;

    const size_t maxLen = std::max(na.size(), nb.size());
    double score = 1.0 - static_cast<double>(diktat::distance(na, nb)) / static_cast<double>(maxLen);

    if (hasAlternateNotation(a) || hasAlternateNotation(b)) {
        score = std::min(1.0, score * kUmlautBoost);
    }
    return score;
}

bool areSimilar(std::string_view a, std::string_view b) {
    auto na = utf8::decode(normalize(a, false));
    auto nb = utf8::decode(normalize(b, false));
    if (na == nb) return true;

    const size_t longer = std::max(na.size(), nb.size());
    const size_t tolerance = longer <= 3 ? 1 : 2;
    return diktat::distance(na, nb) <= tolerance;
}

bool areExactlyEqual(std::string_view a, std::string_view b, bool preserveCase) {
    return normalize(a, preserveCase) == normalize(b, preserveCase);
}

bool isCompoundSubstring(std::string_view small, std::string_view big) {
    const std::string ns = normalize(small, false);
    const std::string nb = normalize(big, false);
    if (ns.empty() || nb.empty()) return false;
    return nb.find(ns) != std::string::npos || ns.find(nb) != std::string::npos;
}

bool isSentenceCorrect(std::string_view reference, std::string_view candidate, bool preserveCase) {
    return normalize(reference, preserveCase) == normalize(candidate, preserveCase);
}

} // namespace diktat

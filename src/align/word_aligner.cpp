#include "align/word_aligner.hpp"
#include "text/similarity.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace diktat {

namespace {

constexpr double kEpsilon = 1e-9;

bool sameCost(double a, double b) {
    return std::fabs(a - b) < kEpsilon;
}

} // namespace

std::vector<AlignmentOp> alignWords(const std::vector<std::string>& referenceWords,
                                    const std::vector<std::string>& candidateWords,
                                    bool preserveCase) {
    const size_t n = referenceWords.size();
    const size_t m = candidateWords.size();

    // pairCost[i][j] and exact[i][j] for reference word i against candidate word j
    std::vector<std::vector<double>> pairCost(n, std::vector<double>(m, 1.0));
    std::vector<std::vector<bool>> exact(n, std::vector<bool>(m, false));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < m; ++j) {
            if (areExactlyEqual(referenceWords[i], candidateWords[j], preserveCase)) {
                exact[i][j] = true;
                pairCost[i][j] = 0.0;
            } else {
                pairCost[i][j] = 1.0 - similarity(referenceWords[i], candidateWords[j]);
            }
        }
    }

    // suffix[i][j]: cheapest script for referenceWords[i..] vs candidateWords[j..]
    std::vector<std::vector<double>> suffix(n + 1, std::vector<double>(m + 1, 0.0));
    for (size_t i = n + 1; i-- > 0;) {
        for (size_t j = m + 1; j-- > 0;) {
            if (i == n && j == m) continue;
            double best = std::numeric_limits<double>::infinity();
            if (i < n && j < m) best = std::min(best, pairCost[i][j] + suffix[i + 1][j + 1]);
            if (i < n) best = std::min(best, 1.0 + suffix[i + 1][j]);
            if (j < m) best = std::min(best, 1.0 + suffix[i][j + 1]);
            suffix[i][j] = best;
        }
    }

    std::vector<AlignmentOp> ops;
    ops.reserve(n + m);
    size_t i = 0, j = 0;
    while (i < n || j < m) {
        if (i < n && j < m && sameCost(suffix[i][j], pairCost[i][j] + suffix[i + 1][j + 1])) {
            ops.push_back(exact[i][j] ? AlignmentOp::match(i, j) : AlignmentOp::substitute(i, j));
            ++i;
            ++j;
        } else if (i < n && (j == m || sameCost(suffix[i][j], 1.0 + suffix[i + 1][j]))) {
            ops.push_back(AlignmentOp::remove(i));
            ++i;
        } else {
            ops.push_back(AlignmentOp::insert(j));
            ++j;
        }
    }
    return ops;
}

AlignmentCounts countOps(const std::vector<AlignmentOp>& ops) {
    AlignmentCounts counts;
    for (const auto& op : ops) {
        switch (op.kind) {
        case AlignmentOp::Kind::Match:      ++counts.matches; break;
        case AlignmentOp::Kind::Substitute: ++counts.substitutions; break;
        case AlignmentOp::Kind::Insert:     ++counts.insertions; break;
        case AlignmentOp::Kind::Delete:     ++counts.deletions; break;
        }
    }
    return counts;
}

} // namespace diktat

#include "core/similarity.h"
#include "core/signal_stats.h"
#include <cmath>
#include <algorithm>

namespace vg {

namespace {

struct Products {
    double ab = 0.0, aa = 0.0, bb = 0.0;
};

// Dot products of (a - ma) and (b - mb)
Products centered_products(const std::vector<float>& a, const std::vector<float>& b,
                           double ma, double mb) {
    Products p;
    for (size_t i = 0; i < a.size(); ++i) {
        const double x = a[i] - ma, y = b[i] - mb;
        p.ab += x * y;
        p.aa += x * x;
        p.bb += y * y;
    }
    return p;
}

// Spread too small relative to the level to define a direction
bool degenerate(double sum_sq, double mean) {
    return !(std::sqrt(sum_sq) > 1e-12 * std::max(1.0, std::abs(mean)));
}

} // anonymous namespace

bool SimilarityCalculator::pearson_correlation(const std::vector<float>& a,
                                               const std::vector<float>& b, float& out) {
    if (a.size() != b.size() || a.size() < 2) return false;
    const double ma = dsp::mean_of(a), mb = dsp::mean_of(b);
    Products p = centered_products(a, b, ma, mb);
    if (degenerate(p.aa, ma) || degenerate(p.bb, mb)) return false;

    double r = p.ab / std::sqrt(p.aa * p.bb);
    if (!std::isfinite(r)) return false;
    out = static_cast<float>(std::max(-1.0, std::min(1.0, r)));
    return true;
}

bool SimilarityCalculator::mean_consecutive_correlation(
    const std::vector<std::vector<float>>& vectors, float& out) {
    if (vectors.size() < 2) return false;

    double sum = 0.0;
    for (size_t i = 0; i + 1 < vectors.size(); ++i) {
        float r = 0.0f;
        if (pearson_correlation(vectors[i], vectors[i + 1], r)) sum += r;
    }
    out = static_cast<float>(sum / (vectors.size() - 1));
    return true;
}

} // namespace vg

#ifndef VG_SIMILARITY_H
#define VG_SIMILARITY_H

#include <vector>

namespace vg {

class SimilarityCalculator {
public:
    // Pearson correlation coefficient in [-1, 1].
    // Returns false when the sizes differ, fewer than two values are given,
    // or either vector is constant (correlation undefined).
    static bool pearson_correlation(const std::vector<float>& a, const std::vector<float>& b,
                                    float& out);

    // Mean Pearson correlation over consecutive pairs (v[0],v[1]), (v[1],v[2]), ...
    // Pairs with an undefined correlation count as 0.
    // Returns false when fewer than two vectors are given.
    static bool mean_consecutive_correlation(const std::vector<std::vector<float>>& vectors,
                                             float& out);
};

} // namespace vg

#endif // VG_SIMILARITY_H

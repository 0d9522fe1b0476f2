#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace fraudshield {

// Shapley values of a set function over n players. A coalition is a mask
// where true means the player takes its real value.
class ShapleyEngine {
public:
    using ValueFn = std::function<double(const std::vector<bool>&)>;

    // All n values from one pass over 2^n coalitions. Requires n <= 20.
    std::vector<double> computeAllExact(int n, const ValueFn& f) const;

    // Monte Carlo over random orderings; each ordering telescopes, so the
    // values still sum to f(all) - f(none).
    std::vector<double> computeAllSampled(
        int n,
        const ValueFn& f,
        std::size_t permutations,
        uint32_t seed
    ) const;

private:
    static std::vector<double> coalitionWeights(int n);
};

}

#include "fraudshield/explain/ShapleyEngine.hpp"

#include <algorithm>
#include <bitset>
#include <numeric>
#include <random>
#include <stdexcept>

namespace fraudshield {

// w(s) = s! (n - s - 1)! / n!
std::vector<double> ShapleyEngine::coalitionWeights(int n) {
    std::vector<double> w(n, 0.0);
    for (int s = 0; s < n; ++s) {
        double v = 1.0 / n;
        // 1/n * 1/C(n-1, s)
        for (int k = 1; k <= s; ++k) {
            v *= static_cast<double>(k) / static_cast<double>(n - s - 1 + k);
        }
        w[s] = v;
    }
    return w;
}

std::vector<double> ShapleyEngine::computeAllExact(int n, const ValueFn& f) const {
    if (n <= 0 || n > 20) {
        throw std::invalid_argument("shapley: exact enumeration needs 1..20 players");
    }

    const uint32_t total = 1u << n;

    // Every coalition evaluated once
    std::vector<double> value(total);
    std::vector<bool> mask(n);
    for (uint32_t m = 0; m < total; ++m) {
        for (int i = 0; i < n; ++i) mask[i] = (m >> i) & 1u;
        value[m] = f(mask);
    }

    const auto weights = coalitionWeights(n);
    std::vector<double> phi(n, 0.0);

    for (uint32_t m = 0; m < total; ++m) {
        const int size = static_cast<int>(std::bitset<32>(m).count());
        for (int i = 0; i < n; ++i) {
            const uint32_t bit = 1u << i;
            if (m & bit) continue;
            phi[i] += weights[size] * (value[m | bit] - value[m]);
        }
    }

    return phi;
}

std::vector<double> ShapleyEngine::computeAllSampled(
    int n,
    const ValueFn& f,
    std::size_t permutations,
    uint32_t seed
) const {
    if (n <= 0 || permutations == 0) {
        throw std::invalid_argument("shapley: need players and permutations");
    }

    std::mt19937 rng(seed);
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);

    std::vector<double> phi(n, 0.0);
    std::vector<bool> mask(n);

    for (std::size_t p = 0; p < permutations; ++p) {
        std::shuffle(order.begin(), order.end(), rng);
        std::fill(mask.begin(), mask.end(), false);

        double prev = f(mask);
        for (int i : order) {
            mask[i] = true;
            const double cur = f(mask);
            phi[i] += cur - prev;
            prev = cur;
        }
    }

    for (auto& v : phi) v /= static_cast<double>(permutations);
    return phi;
}

}

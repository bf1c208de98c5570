#include "rng.hpp"

#include <string>

namespace harvest::game {

int Rng::range(int lo, int hi) {
    if (lo >= hi) {
        throw std::invalid_argument("Rng::range: empty range [" + std::to_string(lo) + ", " +
                                    std::to_string(hi) + ")");
    }
    std::uniform_int_distribution<int> dist(lo, hi - 1);
    return dist(engine_);
}

std::size_t Rng::range(std::size_t lo, std::size_t hi) {
    if (lo >= hi) {
        throw std::invalid_argument("Rng::range: empty range [" + std::to_string(lo) + ", " +
                                    std::to_string(hi) + ")");
    }
    std::uniform_int_distribution<std::size_t> dist(lo, hi - 1);
    return dist(engine_);
}

} // namespace harvest::game

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>

namespace harvest::game {

// Seeded random source shared by level generation and the turn systems.
class Rng {
public:
    explicit Rng(std::uint32_t seed) : seed_(seed), engine_(seed) {}

    std::uint32_t seed() const { return seed_; }

    // Uniform integer in [lo, hi).
    int range(int lo, int hi);
    std::size_t range(std::size_t lo, std::size_t hi);

    bool roll_percent(int percent) { return range(0, 100) < percent; }

    template <typename Container>
    const auto& random_entry(const Container& items) {
        if (items.empty()) {
            throw std::invalid_argument("Rng::random_entry: no items");
        }
        return items[range(std::size_t{0}, items.size())];
    }

private:
    std::uint32_t seed_;
    std::mt19937 engine_;
};

} // namespace harvest::game

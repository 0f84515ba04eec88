#include "rng.hpp"

namespace gpi {

SeededRng::SeededRng(std::uint64_t seed)
    : engine_(seed) {}

double SeededRng::uniform01() {
    const std::uint64_t bits = engine_() >> 11;
    return static_cast<double>(bits) / static_cast<double>(1ULL << 53);
}

} // namespace gpi

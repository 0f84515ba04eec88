#pragma once

#include <cstdint>
#include <random>

namespace gpi {

class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double uniform01() = 0;
};

// mt19937_64 with a fixed seed. The draw is derived from the raw engine output rather than
// std::uniform_real_distribution so the sequence is identical across standard libraries.
class SeededRng : public RandomSource {
public:
    explicit SeededRng(std::uint64_t seed);
    double uniform01() override;

private:
    std::mt19937_64 engine_;
};

} // namespace gpi

#pragma once

#include <cstdint>
#include <random>

namespace sl {

class DeterministicRng {
  public:
    explicit DeterministicRng(uint64_t seed = 0) : eng_(seed) {}

    // Inclusive on both ends.
    int uniform_int(int lo, int hi) {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(eng_);
    }

  private:
    std::mt19937_64 eng_;
};

} // namespace sl

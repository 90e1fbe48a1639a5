#pragma once
#include <cstddef>
#include <cstdint>
#include <random>

// Uniform index source for the picker. Remembers its seed so a verbose run can
// be replayed.
class CRandomGenerator {
  public:
    CRandomGenerator() : m_seed(std::random_device{}()), m_engine(m_seed) {}
    explicit CRandomGenerator(uint32_t seed) : m_seed(seed), m_engine(seed) {}

    // in [0, count), 0 for an empty range
    size_t index(size_t count) {
        if (count == 0)
            return 0;
        return std::uniform_int_distribution<size_t>(0, count - 1)(m_engine);
    }

    uint32_t seed() const {
        return m_seed;
    }

  private:
    uint32_t     m_seed = 0;
    std::mt19937 m_engine;
};

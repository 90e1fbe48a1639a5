#pragma once
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "RandomGenerator.hpp"

// Files whose header can't be decoded pass the size check.
constexpr bool ACCEPT_UNKNOWN_DIMENSIONS = true;

struct SPickOptions {
    uint32_t minWidth    = 0;
    uint32_t minHeight   = 0;
    size_t   maxAttempts = 50;
};

// Draws random candidates until one is at least minWidth x minHeight.
// Files that can't be opened are never picked. Fails if the list is empty or
// every attempt was rejected.
std::expected<std::string, std::string> pickRandomImage(const std::vector<std::string>& candidates, const SPickOptions& options, CRandomGenerator& rng);

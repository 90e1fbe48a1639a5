#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>

struct SImageSize {
    uint32_t width  = 0;
    uint32_t height = 0;

    bool     operator==(const SImageSize&) const = default;
};

namespace ImageSize {
    // enough for any real header we care about
    constexpr size_t          SNIFF_BYTES = 50 * 1024;

    std::optional<SImageSize> fromGIF(std::span<const uint8_t> bytes);
    std::optional<SImageSize> fromJPEG(std::span<const uint8_t> bytes);
    std::optional<SImageSize> fromPNG(std::span<const uint8_t> bytes);

    // tries GIF, JPEG, PNG in order. nullopt means the header was not understood.
    std::optional<SImageSize> fromBytes(std::span<const uint8_t> bytes);

    // error if the file can't be opened or read, nullopt if it was read but not understood
    std::expected<std::optional<SImageSize>, std::string> fromFile(const std::string& path);
};

#include "ImagePicker.hpp"
#include "ImageSize.hpp"
#include "../debug/Log.hpp"

#include <format>

std::expected<std::string, std::string> pickRandomImage(const std::vector<std::string>& candidates, const SPickOptions& options, CRandomGenerator& rng) {
    if (candidates.empty())
        return std::unexpected("no candidate images");

    for (size_t attempt = 0; attempt < options.maxAttempts; ++attempt) {
        const auto& PATH = candidates[rng.index(candidates.size())];
        const auto  SIZE = ImageSize::fromFile(PATH);

        if (!SIZE) {
            Debug::log(TRACE, "pickRandomImage: rejecting {}: {}", PATH, SIZE.error());
            continue;
        }

        if (!SIZE->has_value()) {
            if (ACCEPT_UNKNOWN_DIMENSIONS) {
                Debug::log(TRACE, "pickRandomImage: unknown dimensions for {}, accepting", PATH);
                return PATH;
            }
            continue;
        }

        const auto& DIM = SIZE->value();
        if (DIM.width >= options.minWidth && DIM.height >= options.minHeight) {
            Debug::log(TRACE, "pickRandomImage: picked {} ({}x{}) after {} attempt(s)", PATH, DIM.width, DIM.height, attempt + 1);
            return PATH;
        }

        Debug::log(TRACE, "pickRandomImage: {} is too small ({}x{} < {}x{})", PATH, DIM.width, DIM.height, options.minWidth, options.minHeight);
    }

    return std::unexpected(std::format("no image of at least {}x{} found in {} attempts over {} candidate(s)", options.minWidth, options.minHeight, options.maxAttempts,
                                       candidates.size()));
}

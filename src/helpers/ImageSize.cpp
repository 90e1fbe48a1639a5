#include "ImageSize.hpp"
#include "../debug/Log.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <unistd.h>
#include <vector>

#include <hyprutils/os/FileDescriptor.hpp>
using namespace Hyprutils::OS;

static uint16_t readLE16(std::span<const uint8_t> b, size_t at) {
    return b[at] | (b[at + 1] << 8);
}

static uint16_t readBE16(std::span<const uint8_t> b, size_t at) {
    return (b[at] << 8) | b[at + 1];
}

static uint32_t readBE32(std::span<const uint8_t> b, size_t at) {
    return (uint32_t{b[at]} << 24) | (uint32_t{b[at + 1]} << 16) | (uint32_t{b[at + 2]} << 8) | uint32_t{b[at + 3]};
}

std::optional<SImageSize> ImageSize::fromGIF(std::span<const uint8_t> bytes) {
    if (bytes.size() < 10)
        return std::nullopt;

    if (std::memcmp(bytes.data(), "GIF87a", 6) != 0 && std::memcmp(bytes.data(), "GIF89a", 6) != 0)
        return std::nullopt;

    return SImageSize{.width = readLE16(bytes, 6), .height = readLE16(bytes, 8)};
}

static bool isStartOfFrame(uint8_t marker) {
    // C4 is DHT and CC is DAC, the rest of C0..CF are frame headers
    return marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xCC;
}

static bool isStandaloneMarker(uint8_t marker) {
    // TEM, RSTn and SOI carry no length field
    return marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8);
}

std::optional<SImageSize> ImageSize::fromJPEG(std::span<const uint8_t> bytes) {
    if (bytes.size() < 4 || bytes[0] != 0xFF || bytes[1] != 0xD8)
        return std::nullopt;

    size_t pos = 2;

    while (pos < bytes.size()) {
        if (bytes[pos] != 0xFF) {
            Debug::log(TRACE, "fromJPEG: expected a marker at offset {}, got 0x{:02x}", pos, bytes[pos]);
            return std::nullopt;
        }

        // fill bytes
        while (pos < bytes.size() && bytes[pos] == 0xFF) {
            pos++;
        }

        if (pos >= bytes.size())
            return std::nullopt;

        const uint8_t MARKER = bytes[pos++];

        if (MARKER == 0xDA) // SOS, no frame header before the image data
            return std::nullopt;

        if (isStandaloneMarker(MARKER))
            continue;

        if (pos + 2 > bytes.size())
            return std::nullopt;

        const uint16_t LENGTH = readBE16(bytes, pos);

        if (isStartOfFrame(MARKER)) {
            // length(2) precision(1) height(2) width(2)
            if (pos + 7 > bytes.size())
                return std::nullopt;

            return SImageSize{.width = readBE16(bytes, pos + 5), .height = readBE16(bytes, pos + 3)};
        }

        if (LENGTH < 2)
            return std::nullopt;

        pos += LENGTH;
    }

    return std::nullopt;
}

std::optional<SImageSize> ImageSize::fromPNG(std::span<const uint8_t> bytes) {
    constexpr std::array<uint8_t, 8> SIGNATURE = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

    if (bytes.size() < 24)
        return std::nullopt;

    if (std::memcmp(bytes.data(), SIGNATURE.data(), SIGNATURE.size()) != 0)
        return std::nullopt;

    if (std::memcmp(bytes.data() + 12, "IHDR", 4) != 0)
        return std::nullopt;

    return SImageSize{.width = readBE32(bytes, 16), .height = readBE32(bytes, 20)};
}

std::optional<SImageSize> ImageSize::fromBytes(std::span<const uint8_t> bytes) {
    if (const auto GIF = fromGIF(bytes); GIF)
        return GIF;

    if (const auto JPEG = fromJPEG(bytes); JPEG)
        return JPEG;

    return fromPNG(bytes);
}

std::expected<std::optional<SImageSize>, std::string> ImageSize::fromFile(const std::string& path) {
    CFileDescriptor fd{open(path.c_str(), O_RDONLY | O_CLOEXEC)};

    if (!fd.isValid())
        return std::unexpected(std::format("couldn't open {}: {}", path, strerror(errno)));

    std::vector<uint8_t> bytes(SNIFF_BYTES);
    size_t               got = 0;

    while (got < bytes.size()) {
        const auto READ = read(fd.get(), bytes.data() + got, bytes.size() - got);

        if (READ < 0) {
            if (errno == EINTR)
                continue;
            return std::unexpected(std::format("couldn't read {}: {}", path, strerror(errno)));
        }

        if (READ == 0)
            break;

        got += READ;
    }

    bytes.resize(got);

    return fromBytes(bytes);
}

#include "MiscFunctions.hpp"
#include "../debug/Log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

#include <hyprutils/os/Process.hpp>
#include <hyprutils/path/Path.hpp>
#include <hyprutils/memory/Casts.hpp>
using namespace Hyprutils::OS;
using namespace Hyprutils::Memory;

std::string toLower(std::string_view sv) {
    std::string result{sv};
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

uint64_t fnv1a64(std::string_view sv) {
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : sv) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::string hashName(std::string_view sv) {
    return std::format("{:016x}", fnv1a64(sv));
}

static void appendUTF8(std::string& out, uint32_t cp) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        out += "\xEF\xBF\xBD";
        return;
    }

    if (cp < 0x80)
        out += sc<char>(cp);
    else if (cp < 0x800) {
        out += sc<char>(0xC0 | (cp >> 6));
        out += sc<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += sc<char>(0xE0 | (cp >> 12));
        out += sc<char>(0x80 | ((cp >> 6) & 0x3F));
        out += sc<char>(0x80 | (cp & 0x3F));
    } else {
        out += sc<char>(0xF0 | (cp >> 18));
        out += sc<char>(0x80 | ((cp >> 12) & 0x3F));
        out += sc<char>(0x80 | ((cp >> 6) & 0x3F));
        out += sc<char>(0x80 | (cp & 0x3F));
    }
}

std::string decodeHTMLEntities(std::string_view sv) {
    std::string result;
    result.reserve(sv.size());

    size_t pos = 0;
    while (pos < sv.size()) {
        const auto AMP = sv.find('&', pos);
        if (AMP == std::string_view::npos) {
            result.append(sv.substr(pos));
            break;
        }

        result.append(sv.substr(pos, AMP - pos));

        const auto SEMI = sv.find(';', AMP + 1);
        // entity names are short, anything longer is a literal ampersand
        if (SEMI == std::string_view::npos || SEMI - AMP > 10) {
            result += '&';
            pos = AMP + 1;
            continue;
        }

        const auto NAME = sv.substr(AMP + 1, SEMI - AMP - 1);

        if (NAME.starts_with('#') && NAME.size() > 1) {
            const bool HEX = NAME[1] == 'x' || NAME[1] == 'X';
            const auto NUM = NAME.substr(HEX ? 2 : 1);
            uint32_t   cp  = 0;
            const auto [ptr, ec] = std::from_chars(NUM.data(), NUM.data() + NUM.size(), cp, HEX ? 16 : 10);

            if (ec != std::errc{} || ptr != NUM.data() + NUM.size() || NUM.empty()) {
                result += '&';
                pos = AMP + 1;
                continue;
            }

            appendUTF8(result, cp);
        } else if (NAME == "amp")
            result += '&';
        else if (NAME == "lt")
            result += '<';
        else if (NAME == "gt")
            result += '>';
        else if (NAME == "quot")
            result += '"';
        else if (NAME == "apos")
            result += '\'';
        else if (NAME == "nbsp")
            result += "\xC2\xA0";
        else {
            result += '&';
            pos = AMP + 1;
            continue;
        }

        pos = SEMI + 1;
    }

    return result;
}

std::string expandHome(const std::string& path) {
    if (!path.starts_with('~'))
        return path;

    const auto HOME = Hyprutils::Path::getHome();
    if (!HOME) {
        Debug::log(WARN, "expandHome: no $HOME, leaving {} as-is", path);
        return path;
    }

    return *HOME + path.substr(1);
}

std::expected<std::string, std::string> execAndGet(const std::string& binary, const std::vector<std::string>& args) {
    CProcess proc(binary, args);
    if (!proc.runSync())
        return std::unexpected(std::format("failed to run {}", binary));

    if (proc.exitCode() != 0)
        return std::unexpected(std::format("{} exited with code {}", binary, proc.exitCode()));

    return proc.stdOut();
}

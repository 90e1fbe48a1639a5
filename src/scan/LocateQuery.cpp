#include "LocateQuery.hpp"
#include "../helpers/Extensions.hpp"
#include "../helpers/MiscFunctions.hpp"
#include "../debug/Log.hpp"

#include <algorithm>

static std::string escapeRegex(const std::string& in) {
    static const std::string SPECIAL = "\\^$.|?*+()[]{}";

    std::string              out;
    out.reserve(in.size());
    for (const char c : in) {
        if (SPECIAL.contains(c))
            out += '\\';
        out += c;
    }
    return out;
}

std::vector<std::string> LocateQuery::filter(const std::string& root, const std::string& output) {
    const auto               PREFIX = root.ends_with('/') ? root : root + "/";

    std::vector<std::string> result;
    size_t                   pos = 0;

    while (pos < output.size()) {
        auto end = output.find('\n', pos);
        if (end == std::string::npos)
            end = output.size();

        const auto LINE = output.substr(pos, end - pos);
        pos             = end + 1;

        if (!LINE.starts_with(PREFIX) || !Extensions::hasImageExtension(LINE))
            continue;

        // same rule as the walker: nothing below a dotfile
        if (LINE.find("/.", PREFIX.size() - 1) != std::string::npos)
            continue;

        result.emplace_back(LINE);
    }

    std::ranges::sort(result);
    return result;
}

std::expected<std::vector<std::string>, std::string> LocateQuery::query(const std::string& root) {
    const auto PATTERN = "^" + escapeRegex(root.ends_with('/') ? root : root + "/") + ".*\\.(jpe?g|png|gif)$";

    const auto OUTPUT = execAndGet("locate", {"--existing", "--ignore-case", "--regex", PATTERN});

    if (!OUTPUT)
        return std::unexpected(OUTPUT.error());

    auto result = filter(root, *OUTPUT);

    Debug::log(LOG, "locate returned {} image(s) under {}", result.size(), root);

    return result;
}

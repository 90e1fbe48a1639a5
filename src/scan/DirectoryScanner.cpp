#include "DirectoryScanner.hpp"
#include "../helpers/Extensions.hpp"
#include "../debug/Log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <sys/stat.h>

void DirectoryScanner::scanDirectory(const std::string& dir, SScanContext& ctx) {
    std::error_code ec;
    auto            it = std::filesystem::directory_iterator(dir, ec);

    if (ec) {
        Debug::log(TRACE, "scanDirectory: can't open {}: {}, skipping", dir, ec.message());
        ctx.failedDirs++;
        return;
    }

    std::vector<std::string> names;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        names.emplace_back(it->path().filename().string());
    }

    if (ec) {
        Debug::log(TRACE, "scanDirectory: error reading {}: {}, keeping {} entries", dir, ec.message(), names.size());
        ctx.failedDirs++;
    }

    std::ranges::sort(names);

    for (const auto& name : names) {
        if (name.starts_with('.'))
            continue;

        const auto PATH = dir.ends_with('/') ? dir + name : dir + "/" + name;
        const auto EXT  = Extensions::extensionOf(name);

        if (Extensions::isImage(EXT)) {
            ctx.files.emplace_back(PATH);
            continue;
        }

        if (Extensions::isKnownNonDirectory(EXT)) {
            ctx.skippedEntries++;
            continue;
        }

        struct stat st;
        ctx.statCalls++;
        if (stat(PATH.c_str(), &st) != 0) {
            // dangling symlinks end up here too
            Debug::log(TRACE, "scanDirectory: can't stat {}: {}", PATH, strerror(errno));
            ctx.skippedEntries++;
            continue;
        }

        if (!S_ISDIR(st.st_mode)) {
            ctx.skippedEntries++;
            continue;
        }

        if (!ctx.visitedDirs.emplace(st.st_dev, st.st_ino).second) {
            Debug::log(TRACE, "scanDirectory: {} was already visited, symlink loop?", PATH);
            continue;
        }

        scanDirectory(PATH, ctx);
    }
}

std::expected<std::vector<std::string>, std::string> DirectoryScanner::scan(const std::string& root) {
    std::error_code ec;
    auto            absRoot = std::filesystem::absolute(root, ec).lexically_normal().string();

    if (ec)
        return std::unexpected(std::format("invalid path {}: {}", root, ec.message()));

    if (absRoot.size() > 1 && absRoot.ends_with('/'))
        absRoot.pop_back();

    struct stat st;
    if (stat(absRoot.c_str(), &st) != 0)
        return std::unexpected(std::format("can't stat {}: {}", absRoot, strerror(errno)));

    if (!S_ISDIR(st.st_mode))
        return std::unexpected(std::format("{} is not a directory", absRoot));

    // make sure the root itself can be listed, subtrees are allowed to fail
    std::filesystem::directory_iterator probe(absRoot, ec);
    if (ec)
        return std::unexpected(std::format("can't open {}: {}", absRoot, ec.message()));

    SScanContext ctx;
    ctx.visitedDirs.emplace(st.st_dev, st.st_ino);

    scanDirectory(absRoot, ctx);

    Debug::log(LOG, "Scanned {}: {} image(s), {} stat call(s), {} skipped, {} unreadable dir(s)", absRoot, ctx.files.size(), ctx.statCalls, ctx.skippedEntries, ctx.failedDirs);

    return std::move(ctx.files);
}

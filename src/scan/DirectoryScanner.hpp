#pragma once

#include <cstddef>
#include <expected>
#include <set>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace DirectoryScanner {
    // everything one walk accumulates. Passed down the recursion, never global.
    struct SScanContext {
        std::vector<std::string>          files;
        std::set<std::pair<dev_t, ino_t>> visitedDirs;

        size_t                            statCalls      = 0;
        size_t                            skippedEntries = 0;
        size_t                            failedDirs     = 0;
    };

    // Recursively collects absolute paths of images under root, sorted per directory.
    // Only failing to open root itself is an error.
    std::expected<std::vector<std::string>, std::string> scan(const std::string& root);

    void                                                 scanDirectory(const std::string& dir, SScanContext& ctx);
};

#pragma once

#include <expected>
#include <string>
#include <vector>

namespace LocateQuery {
    // Asks the system locate(1) database for images under root. The result is as
    // stale as the database, an empty list means "ask the filesystem instead".
    std::expected<std::vector<std::string>, std::string> query(const std::string& root);

    // filters raw locate output, exposed for tests
    std::vector<std::string> filter(const std::string& root, const std::string& output);
};

#pragma once
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

std::string                             toLower(std::string_view);

// stable across runs and builds, used for on-disk names
uint64_t                                fnv1a64(std::string_view);
std::string                             hashName(std::string_view);

// decodes named (amp, lt, gt, quot, apos, nbsp) and numeric character references
std::string                             decodeHTMLEntities(std::string_view);

std::string                             expandHome(const std::string&);

std::expected<std::string, std::string> execAndGet(const std::string& binary, const std::vector<std::string>& args);

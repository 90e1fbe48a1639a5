#pragma once
#include <string>
#include <string_view>

namespace Extensions {
    // lower-cased extension of the last path component without the dot, empty if none
    std::string extensionOf(std::string_view path);

    // formats we can sniff and select
    bool        isImage(std::string_view ext);

    // common file types that are never directories, used to skip a stat()
    bool        isKnownNonDirectory(std::string_view ext);

    bool        hasImageExtension(std::string_view path);

    // extension of the path part of a URL, query and fragment ignored
    std::string extensionOfURL(std::string_view url);
};

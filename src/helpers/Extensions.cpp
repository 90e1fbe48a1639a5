#include "Extensions.hpp"
#include "MiscFunctions.hpp"

#include <array>
#include <algorithm>

using namespace std::string_view_literals;

constexpr std::array IMAGE_EXTENSIONS = {"jpg"sv, "jpeg"sv, "png"sv, "gif"sv};

constexpr std::array NON_DIRECTORY_EXTENSIONS = {
    "html"sv, "htm"sv,  "xhtml"sv, "css"sv,  "js"sv,   "json"sv, "xml"sv, "txt"sv,  "rtf"sv,  "md"sv,  "log"sv,  "pdf"sv, "ps"sv,   "eps"sv,   "doc"sv,
    "docx"sv, "xls"sv,  "xlsx"sv,  "ppt"sv,  "pptx"sv, "odt"sv,  "ods"sv, "zip"sv,  "gz"sv,   "tgz"sv, "bz2"sv,  "xz"sv,  "zst"sv,  "tar"sv,   "rar"sv,
    "7z"sv,   "dmg"sv,  "iso"sv,   "img"sv,  "bin"sv,  "exe"sv,  "dll"sv, "so"sv,   "o"sv,    "a"sv,   "c"sv,    "h"sv,   "cc"sv,   "cpp"sv,   "hpp"sv,
    "py"sv,   "pl"sv,   "pm"sv,    "rb"sv,   "sh"sv,   "java"sv, "class"sv, "jar"sv, "mp3"sv,  "m4a"sv, "ogg"sv,  "flac"sv, "wav"sv, "aiff"sv,  "mp4"sv,
    "m4v"sv,  "mov"sv,  "avi"sv,   "mkv"sv,  "webm"sv, "mpg"sv,  "mpeg"sv, "wmv"sv, "psd"sv,  "xcf"sv, "svg"sv,  "tif"sv, "tiff"sv, "bmp"sv,   "ico"sv,
    "raw"sv,  "cr2"sv,  "nef"sv,   "dng"sv,  "ttf"sv,  "otf"sv,  "db"sv,  "sqlite"sv, "plist"sv, "ini"sv, "conf"sv, "bak"sv, "tmp"sv, "part"sv,
};

std::string Extensions::extensionOf(std::string_view path) {
    const auto SLASH = path.find_last_of('/');
    const auto NAME  = SLASH == std::string_view::npos ? path : path.substr(SLASH + 1);
    const auto DOT   = NAME.find_last_of('.');

    // ".bashrc" has no extension
    if (DOT == std::string_view::npos || DOT == 0 || DOT + 1 >= NAME.size())
        return "";

    return toLower(NAME.substr(DOT + 1));
}

bool Extensions::isImage(std::string_view ext) {
    return std::ranges::contains(IMAGE_EXTENSIONS, ext);
}

bool Extensions::isKnownNonDirectory(std::string_view ext) {
    return std::ranges::contains(NON_DIRECTORY_EXTENSIONS, ext);
}

bool Extensions::hasImageExtension(std::string_view path) {
    return isImage(extensionOf(path));
}

std::string Extensions::extensionOfURL(std::string_view url) {
    const auto END = url.find_first_of("?#");
    if (END != std::string_view::npos)
        url = url.substr(0, END);

    // "http://host" has no path to take an extension from
    const auto SCHEME = url.find("://");
    if (SCHEME != std::string_view::npos && url.find('/', SCHEME + 3) == std::string_view::npos)
        return "";

    return extensionOf(url);
}

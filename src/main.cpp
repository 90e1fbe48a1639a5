#include <charconv>
#include <cstring>
#include <iostream>
#include "defines.hpp"
#include "Randpaper.hpp"

static void printUsage() {
    std::cerr << "Randpaper usage: randpaper [arg [...]] <directory | image | http(s)://url | feed://url>.\n\nArguments:\n"
              << "--help       -h      | Show this help message\n"
              << "--verbose    -v      | Log what's going on\n"
              << "--quiet      -q      | Only log errors\n"
              << "--no-cache   -n      | Ignore cached file lists and re-poll feeds\n"
              << "--locate     -l      | Ask the locate database instead of walking directories\n"
              << "--size       -s WxH  | Minimum image size\n"
              << "--config     -c PATH | Specify config file to use\n";
}

static bool parseSize(const std::string& arg, uint32_t& width, uint32_t& height) {
    const auto X = arg.find_first_of("xX");
    if (X == std::string::npos)
        return false;

    const auto W = std::from_chars(arg.data(), arg.data() + X, width);
    const auto H = std::from_chars(arg.data() + X + 1, arg.data() + arg.size(), height);

    return W.ec == std::errc{} && W.ptr == arg.data() + X && H.ec == std::errc{} && H.ptr == arg.data() + arg.size();
}

int main(int argc, char** argv, char** envp) {
    std::string configPath;
    std::string target;
    SRunOptions options;
    bool        forceLocate = false;
    bool        haveSize    = false;
    uint32_t    minWidth = 0, minHeight = 0;

    for (int i = 1; i < argc; ++i) {
        if ((!strcmp(argv[i], "-c") || !strcmp(argv[i], "--config")) && argc >= i + 2) {
            configPath = std::string(argv[++i]);
        } else if ((!strcmp(argv[i], "-s") || !strcmp(argv[i], "--size")) && argc >= i + 2) {
            if (!parseSize(argv[++i], minWidth, minHeight)) {
                std::cerr << "Invalid size " << argv[i] << ", expected WIDTHxHEIGHT\n";
                return 1;
            }
            haveSize = true;
        } else if (!strcmp(argv[i], "--verbose") || !strcmp(argv[i], "-v")) {
            Debug::verbose = true;
        } else if (!strcmp(argv[i], "--quiet") || !strcmp(argv[i], "-q")) {
            Debug::quiet = true;
        } else if (!strcmp(argv[i], "--no-cache") || !strcmp(argv[i], "-n")) {
            options.useCache = false;
        } else if (!strcmp(argv[i], "--locate") || !strcmp(argv[i], "-l")) {
            forceLocate = true;
        } else if (!strcmp(argv[i], "--help") || !strcmp(argv[i], "-h")) {
            printUsage();
            return 0;
        } else if (argv[i][0] != '-' && target.empty()) {
            target = argv[i];
        } else {
            printUsage();
            return 1;
        }
    }

    if (target.empty()) {
        printUsage();
        return 1;
    }

    Debug::log(LOG, "randpaper {} built from commit {} ({})", RANDPAPER_VERSION, GIT_COMMIT_HASH, GIT_COMMIT_MESSAGE);

    g_config = makeUnique<CConfigManager>(configPath);
    g_config->init();

    auto settings = g_config->getSettings();
    if (haveSize) {
        settings.minWidth  = minWidth;
        settings.minHeight = minHeight;
    }
    options.useLocate = forceLocate || settings.useLocate;

    Debug::log(LOG, "State in {}, minimum size {}x{}", settings.stateDir, settings.minWidth, settings.minHeight);

    CRandpaper randpaper(settings, options);
    const auto RESULT = randpaper.pick(target);

    if (!RESULT) {
        Debug::log(CRIT, "{}", RESULT.error());
        return 1;
    }

    std::cout << *RESULT << std::endl;

    return 0;
}

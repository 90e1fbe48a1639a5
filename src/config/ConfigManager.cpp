#include "ConfigManager.hpp"
#include "../defines.hpp"
#include "../helpers/MiscFunctions.hpp"

#include <algorithm>
#include <any>
#include <hyprlang.hpp>
#include <hyprutils/path/Path.hpp>
#include <string>
#include <unistd.h>

using namespace std::string_literals;

static std::string getMainConfigPath() {
    static const auto paths = Hyprutils::Path::findConfig("randpaper");

    return paths.first.value_or("");
}

CConfigManager::CConfigManager(const std::string& configPath) :
    m_config(configPath.empty() ? getMainConfigPath().c_str() : configPath.c_str(), Hyprlang::SConfigOptions{.allowMissingConfig = true}) {
    m_currentConfigPath = configPath.empty() ? getMainConfigPath() : configPath;
}

void CConfigManager::init() {
    m_config.addConfigValue("state_dir", Hyprlang::STRING{""});
    m_config.addConfigValue("list_ttl", Hyprlang::INT{3 * 60 * 60});
    m_config.addConfigValue("feed_ttl", Hyprlang::INT{3 * 60 * 60});
    m_config.addConfigValue("min_width", Hyprlang::INT{255});
    m_config.addConfigValue("min_height", Hyprlang::INT{255});
    m_config.addConfigValue("max_attempts", Hyprlang::INT{50});
    m_config.addConfigValue("http_timeout", Hyprlang::INT{10});
    m_config.addConfigValue("user_agent", Hyprlang::STRING{""});
    m_config.addConfigValue("use_locate", Hyprlang::INT{0});

    m_config.commence();

    if (m_currentConfigPath.empty()) {
        Debug::log(TRACE, "No config file, using defaults");
        return;
    }

    auto result = m_config.parse();

    if (result.error)
        Debug::log(ERR, "Config has errors:\n{}\nProceeding ignoring faulty entries", result.getError());
    else
        Debug::log(TRACE, "Loaded config from {}", m_currentConfigPath);
}

Hyprlang::CConfig* CConfigManager::hyprlang() {
    return &m_config;
}

std::string CConfigManager::defaultStateDir() {
    const auto XDG_CACHE_HOME = getenv("XDG_CACHE_HOME");
    if (XDG_CACHE_HOME && XDG_CACHE_HOME[0] != '\0')
        return std::string{XDG_CACHE_HOME} + "/randpaper";

    const auto HOME = Hyprutils::Path::getHome();
    if (HOME)
        return *HOME + "/.cache/randpaper";

    return "/tmp/randpaper-"s + std::to_string(getuid());
}

static int64_t positive(const char* name, int64_t value, int64_t fallback) {
    if (value > 0)
        return value;

    Debug::log(ERR, "Config value {} must be positive, got {}, using {}", name, value, fallback);
    return fallback;
}

CConfigManager::SSettings CConfigManager::getSettings() {
    SSettings  settings;

    const auto STATE_DIR  = std::any_cast<Hyprlang::STRING>(m_config.getConfigValue("state_dir"));
    const auto USER_AGENT = std::any_cast<Hyprlang::STRING>(m_config.getConfigValue("user_agent"));

    settings.stateDir    = STATE_DIR && STATE_DIR[0] != '\0' ? expandHome(STATE_DIR) : defaultStateDir();
    settings.userAgent   = USER_AGENT && USER_AGENT[0] != '\0' ? std::string{USER_AGENT} : "randpaper/"s + RANDPAPER_VERSION;

    settings.listTTL     = std::chrono::seconds{positive("list_ttl", std::any_cast<Hyprlang::INT>(m_config.getConfigValue("list_ttl")), 3 * 60 * 60)};
    settings.feedTTL     = std::chrono::seconds{positive("feed_ttl", std::any_cast<Hyprlang::INT>(m_config.getConfigValue("feed_ttl")), 3 * 60 * 60)};
    settings.httpTimeout = std::chrono::seconds{positive("http_timeout", std::any_cast<Hyprlang::INT>(m_config.getConfigValue("http_timeout")), 10)};
    settings.maxAttempts = positive("max_attempts", std::any_cast<Hyprlang::INT>(m_config.getConfigValue("max_attempts")), 50);

    settings.minWidth    = std::clamp<Hyprlang::INT>(std::any_cast<Hyprlang::INT>(m_config.getConfigValue("min_width")), 0, UINT32_MAX);
    settings.minHeight   = std::clamp<Hyprlang::INT>(std::any_cast<Hyprlang::INT>(m_config.getConfigValue("min_height")), 0, UINT32_MAX);
    settings.useLocate   = std::any_cast<Hyprlang::INT>(m_config.getConfigValue("use_locate")) != 0;

    return settings;
}

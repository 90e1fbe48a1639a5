#pragma once

#include "../helpers/Memory.hpp"
#include <chrono>
#include <cstdint>
#include <hyprlang.hpp>
#include <string>

class CConfigManager {
  public:
    CConfigManager(const std::string& configPath);
    ~CConfigManager() = default;

    CConfigManager(const CConfigManager&) = delete;
    CConfigManager(CConfigManager&)       = delete;
    CConfigManager(CConfigManager&&)      = delete;

    struct SSettings {
        std::string          stateDir;
        std::chrono::seconds listTTL     = std::chrono::hours{3};
        std::chrono::seconds feedTTL     = std::chrono::hours{3};
        uint32_t             minWidth    = 255;
        uint32_t             minHeight   = 255;
        size_t               maxAttempts = 50;
        std::chrono::seconds httpTimeout = std::chrono::seconds{10};
        std::string          userAgent;
        bool                 useLocate = false;
    };

    void               init();
    Hyprlang::CConfig* hyprlang();

    SSettings          getSettings();

    static std::string defaultStateDir();

  private:
    Hyprlang::CConfig m_config;

    std::string       m_currentConfigPath;
};

inline UP<CConfigManager> g_config;

#pragma once

#include "config/ConfigManager.hpp"
#include "defines.hpp"
#include "helpers/ImagePicker.hpp"
#include "helpers/RandomGenerator.hpp"
#include "net/HttpClient.hpp"

#include <expected>
#include <string>
#include <vector>

struct SRunOptions {
    bool useCache  = true;
    bool useLocate = false;
};

// Turns the command line target into one image path: feeds go through the
// mirror, directories through the file list cache and the walker.
class CRandpaper {
  public:
    CRandpaper(const CConfigManager::SSettings& settings, const SRunOptions& options);
    // for callers that bring their own network access
    CRandpaper(const CConfigManager::SSettings& settings, const SRunOptions& options, IFetcher& fetcher);
    ~CRandpaper() = default;

    CRandpaper(const CRandpaper&) = delete;
    CRandpaper(CRandpaper&)       = delete;
    CRandpaper(CRandpaper&&)      = delete;

    std::expected<std::string, std::string> pick(const std::string& target);

    // feed:// is plain http
    static std::string                      normalizeTarget(const std::string& target);
    static bool                             isURL(const std::string& target);

  private:
    std::expected<std::string, std::string>              pickFromFeed(const std::string& url);
    std::expected<std::string, std::string>              pickFromDirectory(const std::string& dir);
    std::expected<std::vector<std::string>, std::string> enumerate(const std::string& dir);

    SPickOptions                                         pickOptions() const;

    CConfigManager::SSettings                            m_settings;
    SRunOptions                                          m_options;
    CRandomGenerator                                     m_rng;

    UP<CHttpClient>                                      m_ownFetcher;
    IFetcher*                                            m_fetcher = nullptr;
};

#pragma once

#include <chrono>
#include <expected>
#include <string>

// Everything the feed code needs from the network. Tests substitute their own.
class IFetcher {
  public:
    virtual ~IFetcher() = default;

    // body of url
    virtual std::expected<std::string, std::string> get(const std::string& url) = 0;

    // writes url to path. path only ever holds a complete response.
    virtual std::expected<void, std::string> download(const std::string& url, const std::string& path) = 0;
};

struct SHttpOptions {
    std::chrono::seconds timeout   = std::chrono::seconds{10};
    std::string          userAgent = "randpaper";
};

// libcurl-backed fetcher. Redirects are followed and http_proxy / https_proxy /
// no_proxy from the environment apply.
class CHttpClient : public IFetcher {
  public:
    explicit CHttpClient(const SHttpOptions& options);
    ~CHttpClient() override;

    CHttpClient(const CHttpClient&) = delete;
    CHttpClient(CHttpClient&)       = delete;
    CHttpClient(CHttpClient&&)      = delete;

    std::expected<std::string, std::string> get(const std::string& url) override;
    std::expected<void, std::string>        download(const std::string& url, const std::string& path) override;

  private:
    SHttpOptions m_options;
    void*        m_curl = nullptr;
};

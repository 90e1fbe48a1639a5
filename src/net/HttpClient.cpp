#include "HttpClient.hpp"
#include "../debug/Log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <format>
#include <memory>
#include <mutex>
#include <unistd.h>

#include <curl/curl.h>

static void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

static size_t writeToString(char* contents, size_t size, size_t nmemb, void* userp) {
    const size_t N = size * nmemb;
    static_cast<std::string*>(userp)->append(contents, N);
    return N;
}

static size_t writeToFile(char* contents, size_t size, size_t nmemb, void* userp) {
    return fwrite(contents, size, nmemb, static_cast<FILE*>(userp)) * size;
}

CHttpClient::CHttpClient(const SHttpOptions& options) : m_options(options) {
    ensureCurlGlobalInit();
    m_curl = curl_easy_init();

    if (!m_curl)
        Debug::log(ERR, "CHttpClient: curl_easy_init failed");
}

CHttpClient::~CHttpClient() {
    if (m_curl)
        curl_easy_cleanup(static_cast<CURL*>(m_curl));
}

static std::expected<void, std::string> perform(CURL* curl, const std::string& url, const SHttpOptions& options, curl_write_callback writer, void* data) {
    curl_easy_reset(curl);

    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writer);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, data);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    Debug::log(TRACE, "GET {}", url);

    const auto RES = curl_easy_perform(curl);
    if (RES != CURLE_OK)
        return std::unexpected(std::format("{}: {}", url, errbuf[0] ? errbuf : curl_easy_strerror(RES)));

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    if (code >= 400)
        return std::unexpected(std::format("{}: HTTP {}", url, code));

    return {};
}

std::expected<std::string, std::string> CHttpClient::get(const std::string& url) {
    if (!m_curl)
        return std::unexpected("curl is not available");

    std::string body;
    const auto  RESULT = perform(static_cast<CURL*>(m_curl), url, m_options, writeToString, &body);
    if (!RESULT)
        return std::unexpected(RESULT.error());

    Debug::log(TRACE, "Fetched {} byte(s) from {}", body.size(), url);

    return body;
}

std::expected<void, std::string> CHttpClient::download(const std::string& url, const std::string& path) {
    if (!m_curl)
        return std::unexpected("curl is not available");

    const auto TMP = std::format("{}.part.{}", path, getpid());

    std::unique_ptr<FILE, decltype(&fclose)> file(fopen(TMP.c_str(), "wb"), fclose);
    if (!file)
        return std::unexpected(std::format("couldn't create {}: {}", TMP, strerror(errno)));

    auto result = perform(static_cast<CURL*>(m_curl), url, m_options, writeToFile, file.get());

    if (result && fflush(file.get()) != 0)
        result = std::unexpected(std::format("couldn't write {}: {}", TMP, strerror(errno)));

    file.reset();

    std::error_code ec;
    if (result) {
        std::filesystem::rename(TMP, path, ec);
        if (!ec)
            return {};
        result = std::unexpected(std::format("couldn't move {} into place: {}", TMP, ec.message()));
    }

    std::filesystem::remove(TMP, ec);
    return result;
}

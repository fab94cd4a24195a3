#include "http_session.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

HttpSession::HttpSession() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        throw SetupError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }
    spdlog::debug("HTTP session opened");
}

HttpSession::~HttpSession() {
    curl_global_cleanup();
    spdlog::debug("HTTP session closed");
}

namespace http {

CurlHandle make_handle(long timeout_seconds) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    return curl;
}

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

} // namespace http

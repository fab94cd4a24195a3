#pragma once

#include <curl/curl.h>
#include <memory>
#include <string>

// Process-wide libcurl state. Create once in main before any client and
// destroy it only after every thread using a client has been joined.
class HttpSession {
public:
    HttpSession();
    ~HttpSession();

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
};

struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

namespace http {
    // Throws std::runtime_error when libcurl cannot allocate a handle.
    CurlHandle make_handle(long timeout_seconds);
    size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
}

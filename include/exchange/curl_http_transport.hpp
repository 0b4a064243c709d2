#ifndef CURL_HTTP_TRANSPORT_HPP
#define CURL_HTTP_TRANSPORT_HPP

#include "i_http_transport.hpp"
#include <array>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <curl/curl.h>

/**
 * libcurl transport. Each get() uses its own easy handle; DNS lookups and
 * TLS sessions are shared between them through one CURLSH handle.
 */
class CurlHttpTransport : public IHttpTransport {
public:
    explicit CurlHttpTransport(long timeoutSeconds = 3,
                               const std::string& userAgent = "market_floor/1.0");
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    HttpResponse get(const std::string& url) override;
    void close() override;

private:
    static void lockShare(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void unlockShare(CURL* handle, curl_lock_data data, void* userptr);

private:
    long timeoutSeconds_;
    std::string userAgent_;

    CURLSH* share_{nullptr};
    std::array<std::mutex, CURL_LOCK_DATA_LAST> shareMutexes_;

    // get() holds it shared for the whole request, close() exclusively
    std::shared_mutex lifecycleMutex_;
    bool closed_{false};
};

#endif // CURL_HTTP_TRANSPORT_HPP

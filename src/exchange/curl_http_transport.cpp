#include "exchange/curl_http_transport.hpp"
#include <iostream>
#include <stdexcept>

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

// curl_global_init/cleanup are not thread-safe; run them once per process.
namespace {
struct CurlGlobal {
    CURLcode rc;
    CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() {
        if (rc == CURLE_OK) curl_global_cleanup();
    }
};
}

static void ensureCurlGlobal() {
    static CurlGlobal global;
    if (global.rc != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(global.rc));
    }
}

CurlHttpTransport::CurlHttpTransport(long timeoutSeconds, const std::string& userAgent)
    : timeoutSeconds_(timeoutSeconds)
    , userAgent_(userAgent)
{
    ensureCurlGlobal();

    share_ = curl_share_init();
    if (!share_) {
        throw std::runtime_error("curl_share_init failed");
    }
    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlHttpTransport::lockShare);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlHttpTransport::unlockShare);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    // connection caches must not be shared across threads, only DNS and TLS sessions
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
}

CurlHttpTransport::~CurlHttpTransport() {
    close();
}

void CurlHttpTransport::lockShare(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* self = static_cast<CurlHttpTransport*>(userptr);
    self->shareMutexes_[data].lock();
}

void CurlHttpTransport::unlockShare(CURL*, curl_lock_data data, void* userptr) {
    auto* self = static_cast<CurlHttpTransport*>(userptr);
    self->shareMutexes_[data].unlock();
}

HttpResponse CurlHttpTransport::get(const std::string& url) {
    HttpResponse res;

    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        res.error = "transport closed";
        return res;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        res.error = "curl_easy_init failed";
        return res;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_SHARE, share_);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &res.body);

    CURLcode ret = curl_easy_perform(curl);
    if (ret != CURLE_OK) {
        res.error = curl_easy_strerror(ret);
        std::cerr << "[CURL] GET " << url << " failed: " << res.error << "\n";
    } else {
        res.completed = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &res.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return res;
}

void CurlHttpTransport::close() {
    std::unique_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    curl_share_cleanup(share_);
    share_ = nullptr;
}

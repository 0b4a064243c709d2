#ifndef I_HTTP_TRANSPORT_HPP
#define I_HTTP_TRANSPORT_HPP

#include <string>

struct HttpResponse {
    bool completed{false};   // false => no HTTP exchange happened, see `error`
    long status{0};
    std::string body;
    std::string error;
};

/**
 * "Send GET, receive status + body". One instance is shared by every
 * concurrent fetch of a MarketTool, so get() must be thread-safe.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual HttpResponse get(const std::string& url) = 0;

    // release the underlying connection resources; later get() calls fail
    virtual void close() = 0;
};

#endif // I_HTTP_TRANSPORT_HPP

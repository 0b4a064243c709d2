#include "exchange/payload_fetcher.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

PayloadFetcher::PayloadFetcher(IHttpTransport* transport,
                               RateLimiter* limiter,
                               const std::string& baseUrl,
                               std::chrono::milliseconds backoff)
    : transport_(transport)
    , limiter_(limiter)
    , baseUrl_(baseUrl)
    , backoff_(backoff)
{
    if (!transport_ || !limiter_) {
        throw std::invalid_argument("PayloadFetcher needs a transport and a rate limiter");
    }
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

std::string PayloadFetcher::normalizeTargetName(FetchOperation operation, const std::string& targetName) {
    const char* ws = " \t\n\r\f\v";
    size_t first = targetName.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = targetName.find_last_not_of(ws);
    std::string name = targetName.substr(first, last - first + 1);

    if (operation == FetchOperation::ITEM_ORDERS) {
        std::replace(name.begin(), name.end(), ' ', '_');
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    return name;
}

std::string PayloadFetcher::buildUrl(FetchOperation operation, const std::string& normalizedName) const {
    if (operation == FetchOperation::ITEM_ORDERS) {
        return baseUrl_ + "/items/" + normalizedName + "/orders";
    }
    return baseUrl_ + "/profile/" + normalizedName + "/orders";
}

// The limiter guarantees a free slot within one window, so no retry cap.
void PayloadFetcher::waitForSlot(const std::string& target) {
    while (!limiter_->tryAdmit()) {
        rateLimitRetries_ += 1;
        std::cerr << "[FETCH] request limit reached for " << target
                  << ", trying again in " << backoff_.count() << "ms\n";
        std::this_thread::sleep_for(backoff_);
    }
}

FetchResult PayloadFetcher::fetch(FetchOperation operation, const std::string& targetName) {
    FetchResult res;
    res.payload.operation = operation;

    std::string name = normalizeTargetName(operation, targetName);
    if (name.empty()) {
        throw std::invalid_argument("empty target name for " + toString(operation));
    }

    if (verbose_) {
        std::cout << "[FETCH] attempting to acquire " << toString(operation)
                  << " for " << name << "\n";
    }

    waitForSlot(name);

    std::string url = buildUrl(operation, name);
    HttpResponse http = transport_->get(url);

    if (!http.completed) {
        res.error = FetchError::TRANSPORT;
        res.message = http.error.empty() ? "no response" : http.error;
        std::cerr << "[FETCH] failed to acquire " << name << ": " << res.message << "\n";
        return res;
    }

    res.httpStatus = static_cast<int>(http.status);
    if (http.status != 200) {
        res.error = FetchError::HTTP_STATUS;
        res.message = "expected http status 200, got http status " + std::to_string(http.status);
        std::cerr << "[FETCH] failed to acquire " << name << ": " << res.message << "\n";
        return res;
    }

    try {
        json body = json::parse(http.body);
        auto it = body.is_object() ? body.find("payload") : body.end();
        if (!body.is_object() || it == body.end() || it->is_null()) {
            // empty but valid; callers treat it as "no orders"
            std::cerr << "[FETCH] response for " << name << " has no payload\n";
        } else {
            res.payload = decodePayload(operation, *it);
        }
    } catch (const json::exception& e) {
        res.error = FetchError::DECODE;
        res.message = std::string("invalid JSON body: ") + e.what();
        std::cerr << "[FETCH] failed to decode " << name << ": " << res.message << "\n";
        return res;
    } catch (const std::invalid_argument& e) {
        res.error = FetchError::DECODE;
        res.message = e.what();
        std::cerr << "[FETCH] failed to decode " << name << ": " << res.message << "\n";
        return res;
    }

    res.success = true;
    if (verbose_) {
        std::cout << "[FETCH] successfully acquired " << name << "\n";
    }
    return res;
}

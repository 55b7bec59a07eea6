#pragma once

#include "network/IHttpClient.h"
#include "network/RequestSigner.h"
#include "execution/RateLimiter.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace gapswing {
namespace network {

// Binance USD-M futures REST client. get() is unsigned (market data);
// post(), del() and signedGet() carry an HMAC-SHA256 signature.
// Network errors, 429/418 and 5xx are retried with exponential backoff.
class BinanceHttpClient : public IHttpClient {
public:
    BinanceHttpClient(const std::string& api_key,
                      const std::string& api_secret,
                      const std::string& base_url = "https://fapi.binance.com",
                      long long recv_window_ms = 5000,
                      int max_retries = 3);
    ~BinanceHttpClient();

    BinanceHttpClient(const BinanceHttpClient&) = delete;
    BinanceHttpClient& operator=(const BinanceHttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const std::map<std::string, std::string>& params
    ) override;

    HttpResponse del(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    HttpResponse signedGet(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    );

    bool hasCredentials() const { return !api_key_.empty() && !api_secret_.empty(); }

    // Typed wrappers. Throw std::runtime_error on a non-2xx answer.
    nlohmann::json getKlines(const std::string& symbol, const std::string& interval, int limit);
    nlohmann::json getTickerPrice(const std::string& symbol);
    nlohmann::json getExchangeInfo();
    nlohmann::json getBalance();
    nlohmann::json getPositionRisk(const std::string& symbol);
    nlohmann::json placeOrder(const std::map<std::string, std::string>& params);
    nlohmann::json cancelAllOpenOrders(const std::string& symbol);

private:
    std::string api_key_;
    std::string api_secret_;
    std::string base_url_;
    long long recv_window_ms_;
    int max_retries_;
    CURL* curl_;
    std::mutex mutex_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;

    HttpResponse send(
        const std::string& method,
        const std::string& endpoint,
        const std::map<std::string, std::string>& params,
        bool sign,
        const std::string& group
    );

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::map<std::string, std::string>& headers
    );

    static nlohmann::json expectJson(const HttpResponse& response, const std::string& what);
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace network
} // namespace gapswing

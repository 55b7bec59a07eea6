#include "network/BinanceHttpClient.h"
#include "common/Logger.h"
#include "common/Types.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace gapswing {
namespace network {

namespace {
std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isRetryable(const HttpResponse& response) {
    return response.isRateLimited() || response.isBlocked() || response.isServerError();
}
}

BinanceHttpClient::BinanceHttpClient(const std::string& api_key,
                                     const std::string& api_secret,
                                     const std::string& base_url,
                                     long long recv_window_ms,
                                     int max_retries)
    : api_key_(api_key)
    , api_secret_(api_secret)
    , base_url_(base_url)
    , recv_window_ms_(recv_window_ms)
    , max_retries_(std::max(1, max_retries))
    , curl_(nullptr)
    , rate_limiter_(std::make_shared<execution::RateLimiter>())
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

BinanceHttpClient::~BinanceHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

HttpResponse BinanceHttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    return send("GET", endpoint, query_params, false, "market");
}

HttpResponse BinanceHttpClient::post(
    const std::string& endpoint,
    const std::map<std::string, std::string>& params
) {
    return send("POST", endpoint, params, true, "order");
}

HttpResponse BinanceHttpClient::del(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    return send("DELETE", endpoint, query_params, true, "order");
}

HttpResponse BinanceHttpClient::signedGet(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    return send("GET", endpoint, query_params, true, "account");
}

HttpResponse BinanceHttpClient::send(
    const std::string& method,
    const std::string& endpoint,
    const std::map<std::string, std::string>& params,
    bool sign,
    const std::string& group
) {
    if (sign && !hasCredentials()) {
        throw std::runtime_error("signed request " + endpoint + " without API credentials");
    }

    HttpResponse response;
    std::string last_error;

    for (int attempt = 0; attempt < max_retries_; ++attempt) {
        if (attempt > 0) {
            // 1s, 2s, 4s, ...
            std::this_thread::sleep_for(std::chrono::seconds(1LL << (attempt - 1)));
        }

        rate_limiter_->acquire(group);

        // Signed queries carry a timestamp, so they are rebuilt on every attempt.
        std::string query = sign
            ? RequestSigner::signedQuery(api_secret_, params, currentTimeMs(), recv_window_ms_)
            : RequestSigner::buildQueryString(params);
        std::string url = base_url_ + endpoint;
        if (!query.empty()) {
            url += "?" + query;
        }

        std::map<std::string, std::string> headers;
        if (!api_key_.empty()) {
            headers["X-MBX-APIKEY"] = api_key_;
        }

        try {
            response = performRequest(method, url, headers);
        } catch (const std::runtime_error& e) {
            last_error = e.what();
            LOG_WARN("{} {} failed (attempt {}/{}): {}", method, endpoint, attempt + 1, max_retries_, last_error);
            continue;
        }

        auto weight = response.headers.find("x-mbx-used-weight-1m");
        if (weight != response.headers.end()) {
            rate_limiter_->updateFromHeader(weight->second);
        }

        if (response.isRateLimited() || response.isBlocked()) {
            rate_limiter_->handleRateLimitError(response.status_code);
        }

        if (!isRetryable(response)) {
            return response;
        }

        last_error = "HTTP " + std::to_string(response.status_code);
        LOG_WARN("{} {} returned {} (attempt {}/{})", method, endpoint, response.status_code,
                 attempt + 1, max_retries_);
    }

    if (response.status_code == 0) {
        throw std::runtime_error("Max retries exceeded for " + endpoint + ": " + last_error);
    }
    return response;
}

nlohmann::json BinanceHttpClient::expectJson(const HttpResponse& response, const std::string& what) {
    if (!response.isSuccess()) {
        throw std::runtime_error("Failed to " + what + ": HTTP " + std::to_string(response.status_code) +
                                 " " + response.body);
    }
    try {
        return response.json();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to " + what + ": malformed response: " + e.what());
    }
}

nlohmann::json BinanceHttpClient::getKlines(const std::string& symbol, const std::string& interval, int limit) {
    std::map<std::string, std::string> params;
    params["symbol"] = symbol;
    params["interval"] = interval;
    params["limit"] = std::to_string(limit);
    return expectJson(get("/fapi/v1/klines", params), "get klines for " + symbol);
}

nlohmann::json BinanceHttpClient::getTickerPrice(const std::string& symbol) {
    std::map<std::string, std::string> params;
    params["symbol"] = symbol;
    return expectJson(get("/fapi/v1/ticker/price", params), "get ticker for " + symbol);
}

nlohmann::json BinanceHttpClient::getExchangeInfo() {
    return expectJson(get("/fapi/v1/exchangeInfo"), "get exchange info");
}

nlohmann::json BinanceHttpClient::getBalance() {
    return expectJson(signedGet("/fapi/v2/balance"), "get balance");
}

nlohmann::json BinanceHttpClient::getPositionRisk(const std::string& symbol) {
    std::map<std::string, std::string> params;
    params["symbol"] = symbol;
    return expectJson(signedGet("/fapi/v2/positionRisk", params), "get position risk for " + symbol);
}

nlohmann::json BinanceHttpClient::placeOrder(const std::map<std::string, std::string>& params) {
    auto it = params.find("symbol");
    const std::string symbol = it != params.end() ? it->second : std::string("?");
    return expectJson(post("/fapi/v1/order", params), "place order on " + symbol);
}

nlohmann::json BinanceHttpClient::cancelAllOpenOrders(const std::string& symbol) {
    std::map<std::string, std::string> params;
    params["symbol"] = symbol;
    return expectJson(del("/fapi/v1/allOpenOrders", params), "cancel open orders on " + symbol);
}

HttpResponse BinanceHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, 30L);

    if (method == "POST") {
        // Parameters travel in the signed query string; the body stays empty.
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, "");
    } else if (method == "DELETE") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw std::runtime_error("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = response_body;
    response.headers = response_headers;

    return response;
}

size_t BinanceHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t BinanceHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        // HTTP/2 lowercases header names; normalize so lookups work either way.
        std::string key = lowerCopy(header_line.substr(0, colon_pos));
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

} // namespace network
} // namespace gapswing

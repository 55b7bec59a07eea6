#pragma once

#include <string>
#include <map>

namespace gapswing {
namespace network {

// Binance SIGNED endpoints: HMAC-SHA256 of the exact query string, hex encoded,
// appended as `signature`.
class RequestSigner {
public:
    static std::string hmacSha256Hex(const std::string& secret, const std::string& message);

    // key=value pairs joined by '&' in key order.
    static std::string buildQueryString(const std::map<std::string, std::string>& params);

    // Adds timestamp and recvWindow, then the signature over everything before it.
    static std::string signedQuery(
        const std::string& secret,
        std::map<std::string, std::string> params,
        long long timestamp_ms,
        long long recv_window_ms
    );
};

} // namespace network
} // namespace gapswing

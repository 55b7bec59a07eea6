#include "network/RequestSigner.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace gapswing {
namespace network {

std::string RequestSigner::hmacSha256Hex(const std::string& secret, const std::string& message) {
    unsigned char signature[EVP_MAX_MD_SIZE];
    unsigned int signature_len = 0;

    const unsigned char* result = HMAC(
        EVP_sha256(),
        secret.data(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        signature, &signature_len);
    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < signature_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(signature[i]);
    }
    return oss.str();
}

std::string RequestSigner::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::string RequestSigner::signedQuery(
    const std::string& secret,
    std::map<std::string, std::string> params,
    long long timestamp_ms,
    long long recv_window_ms
) {
    params["timestamp"] = std::to_string(timestamp_ms);
    if (recv_window_ms > 0) {
        params["recvWindow"] = std::to_string(recv_window_ms);
    }
    const std::string query = buildQueryString(params);
    return query + "&signature=" + hmacSha256Hex(secret, query);
}

} // namespace network
} // namespace gapswing

#include "network/RequestSigner.h"

#include <iostream>
#include <map>
#include <string>

using gapswing::network::RequestSigner;

int main() {
    // RFC 4231 test case 2.
    const std::string rfc = RequestSigner::hmacSha256Hex("Jefe", "what do ya want for nothing?");
    if (rfc != "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843") {
        std::cerr << "[TEST] RFC 4231 case 2 mismatch: " << rfc << "\n";
        return 1;
    }

    const std::string empty = RequestSigner::hmacSha256Hex("", "");
    if (empty != "b613679a0814d9ec772f95d778c35fc5ff1697c493715653c6c712144292c5ad") {
        std::cerr << "[TEST] empty key/message mismatch: " << empty << "\n";
        return 1;
    }

    const std::map<std::string, std::string> params = {
        {"symbol", "BTCUSDT"},
        {"side", "BUY"},
        {"type", "MARKET"}
    };
    if (RequestSigner::buildQueryString(params) != "side=BUY&symbol=BTCUSDT&type=MARKET") {
        std::cerr << "[TEST] buildQueryString should join in key order\n";
        return 1;
    }
    if (!RequestSigner::buildQueryString({}).empty()) {
        std::cerr << "[TEST] empty params should give an empty query\n";
        return 1;
    }

    const std::string signed_query = RequestSigner::signedQuery(
        "test-secret", {{"symbol", "BTCUSDT"}}, 1700000000000LL, 5000);
    const std::string expected =
        "recvWindow=5000&symbol=BTCUSDT&timestamp=1700000000000"
        "&signature=0d90f16f7356bb8fcf3ca4e5d43d1a9768d14daa3720f9e22788780ce8cf6c7a";
    if (signed_query != expected) {
        std::cerr << "[TEST] signedQuery mismatch: " << signed_query << "\n";
        return 1;
    }

    const std::string no_window = RequestSigner::signedQuery("test-secret", {}, 1700000000000LL, 0);
    if (no_window.rfind("timestamp=1700000000000&signature=", 0) != 0) {
        std::cerr << "[TEST] recvWindow=0 should be omitted: " << no_window << "\n";
        return 1;
    }

    std::cout << "[TEST] RequestSigner PASSED\n";
    return 0;
}

#pragma once

#include "config/Config.hpp"
#include "util/curlWrappers.hpp"

#include <string>
#include <vector>

namespace kvs::util {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;
};

// Blocking transport shared by the token endpoints and the vault client. No retries.
class HttpClient {
public:
    explicit HttpClient(config::HttpConfig cfg = {});
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual HttpResponse perform(const HttpRequest& req) const;

private:
    config::HttpConfig cfg_;
};

}

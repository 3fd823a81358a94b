#include "util/HttpClient.hpp"
#include "logging/LogRegistry.hpp"

using namespace kvs::util;
using namespace kvs::logging;

HttpClient::HttpClient(config::HttpConfig cfg) : cfg_(std::move(cfg)) {
    ensureCurlGlobalInit();
}

HttpResponse HttpClient::perform(const HttpRequest& req) const {
    SList hdrs;
    for (const auto& h : req.headers) hdrs.add(h);

    HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout_seconds));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
        curl_easy_setopt(h, CURLOPT_USERAGENT, cfg_.user_agent.c_str());
        if (req.method != "GET") curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        if (!req.body.empty() || req.method == "POST" || req.method == "PUT") {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
        }
        if (hdrs.get()) curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (resp.curl != CURLE_OK)
        LogRegistry::http()->warn("[HttpClient] {} {} failed: {}", req.method, req.url, curl_easy_strerror(resp.curl));
    else
        LogRegistry::http()->debug("[HttpClient] {} {} -> HTTP {}", req.method, req.url, resp.http);

    return resp;
}

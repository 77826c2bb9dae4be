#pragma once

#include "dreamgroup/config.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace boost::asio::ssl {
class context;
}

namespace dreamgroup::oracle {

struct HttpResponse {
    unsigned status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * Blocking HTTP/1.1 client for the remote services (chat completions and embeddings).
 *
 * One connection per request, with or without TLS depending on the service configuration.
 * Every network step is bounded by the service's timeout_ms. Transport failures throw
 * OracleError (ORACLE_TIMEOUT for expired deadlines); HTTP error statuses are returned
 * to the caller untouched.
 */
class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // POST a JSON body to service.target, with Bearer auth when the service has an api_key
    virtual HttpResponse post_json(const ServiceConfig& service, const std::string& body,
                                   const HttpHeaders& extra_headers = {});

private:
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
};

} // namespace dreamgroup::oracle

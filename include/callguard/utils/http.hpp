#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace callguard::utils {

struct ParsedUrl {
    std::string scheme = "http";
    std::string host;
    int port = 0;
    std::string path = "/";

    // scheme://host[:port] without the path; default ports are omitted.
    std::string origin() const;
};

// Lenient parser for notification endpoints; a missing scheme means http.
ParsedUrl parse_url(const std::string& url);

std::string resolve_redirect_url(const std::string& base_url,
                                 const std::string& location);

struct HttpResult {
    int status = 0;
    std::string body;
    std::string error;

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

// POSTs a JSON document, following up to five redirects.
HttpResult post_json(const std::string& url,
                     const std::string& body,
                     const std::optional<std::string>& bearer_token,
                     std::chrono::seconds timeout);

}

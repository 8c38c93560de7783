#include "callguard/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <httplib.h>
#include <stdexcept>

#include "callguard/logging.hpp"

namespace callguard::utils {

namespace {

constexpr int kMaxRedirects = 5;

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

int default_port(const std::string& scheme) {
    return (scheme == "https" || scheme == "wss") ? 443 : 80;
}

}

std::string ParsedUrl::origin() const {
    std::string out = scheme + "://" + host;
    if (port > 0 && port != default_port(scheme)) {
        out += ":" + std::to_string(port);
    }
    return out;
}

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl parsed;
    std::string rest = url;

    const auto separator = rest.find("://");
    if (separator != std::string::npos) {
        parsed.scheme = rest.substr(0, separator);
        std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        rest.erase(0, separator + 3);
    }

    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        parsed.path = rest.substr(slash);
        rest.resize(slash);
    }

    const auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        parsed.host = rest;
        parsed.port = default_port(parsed.scheme);
        return parsed;
    }
    parsed.host = rest.substr(0, colon);
    try {
        parsed.port = std::stoi(rest.substr(colon + 1));
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid port in url: " + url);
    }
    return parsed;
}

std::string resolve_redirect_url(const std::string& base_url,
                                 const std::string& location) {
    if (location.empty()) {
        return "";
    }
    if (location.find("://") != std::string::npos) {
        return location;
    }
    const auto base = parse_url(base_url);
    if (location.front() == '/') {
        return base.origin() + location;
    }
    const auto dir = base.path.substr(0, base.path.find_last_of('/') + 1);
    return base.origin() + dir + location;
}

HttpResult post_json(const std::string& url,
                     const std::string& body,
                     const std::optional<std::string>& bearer_token,
                     std::chrono::seconds timeout) {
    std::string target = url;
    for (int hop = 0; hop < kMaxRedirects; ++hop) {
        ParsedUrl parsed;
        try {
            parsed = parse_url(target);
        } catch (const std::invalid_argument& ex) {
            return {0, "", ex.what()};
        }
        if (parsed.host.empty()) {
            return {0, "", "invalid url: " + target};
        }

        httplib::Headers headers = {
            {"User-Agent", "callguard/1.0"},
            {"Accept", "application/json"}
        };
        if (bearer_token) {
            headers.emplace("Authorization", "Bearer " + *bearer_token);
        }

        httplib::Client client(parsed.origin());
        client.set_connection_timeout(timeout.count(), 0);
        client.set_read_timeout(timeout.count(), 0);
        client.set_write_timeout(timeout.count(), 0);
        auto response = client.Post(parsed.path.c_str(), headers, body, "application/json");
        if (!response) {
            return {0, "", "request failed: " + httplib::to_string(response.error())};
        }
        if (!is_redirect(response->status)) {
            return {response->status, response->body, ""};
        }

        const auto location = response->headers.find("Location");
        if (location == response->headers.end()) {
            return {response->status, response->body, "redirect without location"};
        }
        const auto next = resolve_redirect_url(target, location->second);
        if (next.empty()) {
            return {response->status, response->body, "invalid redirect"};
        }
        logging::debug("HTTP redirect",
                       {kv("status", response->status), kv("from", target), kv("to", next)});
        target = next;
    }
    return {0, "", "too many redirects"};
}

}

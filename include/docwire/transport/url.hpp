#pragma once

#include <cstdio>
#include <map>
#include <string>
#include <string_view>

#include "docwire/result.hpp"

namespace docwire {

    struct UrlComponents {
        bool https{false};
        std::string host;
        std::string port;
        // Absolute URL: request target (path + optional query).
        // Base URL (parse_base_url): path prefix without trailing '/', or "".
        std::string target;
    };

    namespace url_utils {

        inline Result<UrlComponents> invalid_url(std::string message) {
            return Result<UrlComponents>::err(
                Error{Error::Code::InvalidUrl, std::move(message)});
        }

        /// @brief True if `s` starts with "http://" or "https://".
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return s.rfind("https://", 0) == 0 || s.rfind("http://", 0) == 0;
        }

        inline std::string trim_trailing_slashes(std::string s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
            return s;
        }

        /// @brief Percent-encode everything except RFC 3986 unreserved
        /// characters.
        inline std::string url_encode(std::string_view in) {
            std::string out;
            out.reserve(in.size());
            for (unsigned char c : in) {
                if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                    c == '.' || c == '~') {
                    out.push_back(static_cast<char>(c));
                } else {
                    char buf[4];
                    std::snprintf(buf, sizeof(buf), "%%%02X", c);
                    out.append(buf, 3);
                }
            }
            return out;
        }

        /// @brief Append `params` to `target` as an encoded query string.
        inline std::string append_query(
            std::string target, const std::map<std::string, std::string>& params) {
            if (params.empty()) return target;
            char sep = target.find('?') == std::string::npos ? '?' : '&';
            for (const auto& [k, v] : params) {
                target.push_back(sep);
                target += url_encode(k);
                target.push_back('=');
                target += url_encode(v);
                sep = '&';
            }
            return target;
        }

    }  // namespace url_utils

    /// @brief Parse an absolute http(s) URL.
    /// @return The components, or InvalidUrl.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        using url_utils::invalid_url;

        UrlComponents out;
        std::string_view s = url;
        if (s.rfind("https://", 0) == 0) {
            out.https = true;
            s.remove_prefix(8);
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(7);
        } else {
            return invalid_url("URL must start with http:// or https://");
        }

        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto slash = s.find('/'); slash != std::string_view::npos) {
            hostport = s.substr(0, slash);
            path = s.substr(slash);
        }
        if (hostport.empty()) return invalid_url("URL missing host");

        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
            if (out.port.empty()) return invalid_url("URL has empty port");
        } else {
            out.host = std::string(hostport);
            out.port = out.https ? "443" : "80";
        }
        if (out.host.empty()) return invalid_url("URL has empty host");

        out.target = std::string(path);
        return Result<UrlComponents>::ok(std::move(out));
    }

    namespace url_utils {

        /// @brief Parse a base URL whose path is used as a prefix for every
        /// call. The prefix is normalised ("/" and trailing '/' dropped) and
        /// may not carry a query.
        inline Result<UrlComponents> parse_base_url(std::string_view base_url) {
            if (base_url.empty()) return invalid_url("base_url is empty");

            auto parsed = parse_url(base_url);
            if (parsed.has_error()) return parsed;

            UrlComponents base = std::move(parsed).value();
            base.target = trim_trailing_slashes(std::move(base.target));
            if (base.target.find('?') != std::string::npos) {
                return invalid_url("base_url must not include query parameters");
            }
            return Result<UrlComponents>::ok(std::move(base));
        }

        /// @brief Join a base (from parse_base_url) and a relative path.
        inline UrlComponents join(const UrlComponents& base,
                                  std::string_view relative) {
            UrlComponents out = base;
            if (relative.empty() || relative.front() != '/') {
                out.target.push_back('/');
            }
            out.target.append(relative);
            return out;
        }

    }  // namespace url_utils

}  // namespace docwire

#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <stdexcept>
#include <string>

namespace docwire {

    /// @brief host:port (+ scheme) a connection is bound to.
    struct Endpoint {
        std::string host;
        std::string port;
        bool https{false};

        void normalize() {
            if (port.empty()) port = https ? "443" : "80";
            if (host.empty()) host = "localhost";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        friend bool operator==(Endpoint const& a, Endpoint const& b) noexcept {
            return a.https == b.https && a.host == b.host && a.port == b.port;
        }
    };

    /// @brief Set the SNI host name on a TLS stream before the handshake.
    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load the system CA store and pick the verification mode.
    inline void init_tls_context(boost::asio::ssl::context& ssl_context,
                                 bool verify_peer) {
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }
        ssl_context.set_verify_mode(verify_peer ? boost::asio::ssl::verify_peer
                                                : boost::asio::ssl::verify_none);
    }

}  // namespace docwire

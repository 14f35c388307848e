#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "docwire/rpc/call_options.hpp"

namespace docwire {

    /**
     * @brief Interface for adjusting the options of every call before it is
     * issued.
     *
     * Interceptors are used for cross-cutting concerns like authentication
     * or custom headers. They run after the routing header has been set.
     */
    class CallInterceptor {
       public:
        virtual ~CallInterceptor() = default;

        /**
         * @brief Performs modifications on the outgoing call options.
         * @param options The options to modify.
         * @param method The RPC method the options are for.
         */
        virtual void prepare(CallOptions& options,
                             std::string_view method) const = 0;
    };

    /**
     * @brief Adds an `Authorization: Bearer <token>` header to every call.
     */
    class BearerAuthInterceptor : public CallInterceptor {
       public:
        explicit BearerAuthInterceptor(std::string token)
            : token_(std::move(token)) {}

        void prepare(CallOptions& options,
                     std::string_view /*method*/) const override {
            options.headers["Authorization"] = "Bearer " + token_;
        }

       private:
        std::string token_;
    };

    /**
     * @brief Adds an API key either as a header or as a query parameter.
     */
    class ApiKeyInterceptor : public CallInterceptor {
       public:
        /** @brief Specifies where the API key should be placed. */
        enum class Location : std::uint8_t {
            Header, /**< Place in a request header. */
            Query   /**< Place in the URL query string. */
        };

        explicit ApiKeyInterceptor(std::string key, std::string value,
                                   Location loc = Location::Header)
            : key_(std::move(key)), value_(std::move(value)), loc_(loc) {}

        void prepare(CallOptions& options,
                     std::string_view /*method*/) const override {
            if (loc_ == Location::Header) {
                options.headers[key_] = value_;
            } else {
                options.query[key_] = value_;
            }
        }

       private:
        std::string key_;
        std::string value_;
        Location loc_;
    };

    using InterceptorList = std::vector<std::shared_ptr<const CallInterceptor>>;

}  // namespace docwire

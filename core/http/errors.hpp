#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace hostlink
{
    namespace http
    {

        /**
         * @brief REST status codes mapped to HTTP status codes
         *
         * Shared by the loopback daemon and the bridge REST API:
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400
         * - PERMISSION_DENIED -> HTTP 403
         * - NOT_FOUND -> HTTP 404
         * - RESOURCE_EXHAUSTED -> HTTP 429
         * - INTERNAL -> HTTP 500
         * - UPSTREAM_ERROR -> HTTP 502
         * - UNAVAILABLE -> HTTP 503
         * - DEADLINE_EXCEEDED -> HTTP 504
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            PERMISSION_DENIED,
            NOT_FOUND,
            RESOURCE_EXHAUSTED,
            INTERNAL,
            UPSTREAM_ERROR,
            UNAVAILABLE,
            DEADLINE_EXCEEDED
        };

        /**
         * @brief Convert StatusCode to HTTP status integer
         */
        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::PERMISSION_DENIED:
                return 403;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::RESOURCE_EXHAUSTED:
                return 429;
            case StatusCode::INTERNAL:
                return 500;
            case StatusCode::UPSTREAM_ERROR:
                return 502;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::DEADLINE_EXCEEDED:
                return 504;
            default:
                return 500;
            }
        }

        /**
         * @brief Convert StatusCode to string representation
         */
        inline std::string status_code_to_string(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return "OK";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::PERMISSION_DENIED:
                return "PERMISSION_DENIED";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::RESOURCE_EXHAUSTED:
                return "RESOURCE_EXHAUSTED";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            case StatusCode::UPSTREAM_ERROR:
                return "UPSTREAM_ERROR";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::DEADLINE_EXCEEDED:
                return "DEADLINE_EXCEEDED";
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Build a JSON status object
         *
         * All HTTP responses include a top-level "status" object with code and message.
         */
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        /**
         * @brief Build a complete JSON error response
         *
         * Creates a JSON object with just the status field for error responses.
         */
        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            return {
                {"status", make_status(code, message)}};
        }

    } // namespace http
} // namespace hostlink

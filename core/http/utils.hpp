#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "errors.hpp"

namespace hostlink
{
    namespace http
    {

        // Helper: First regex capture of the route, e.g. the user id in /v0/agents/([^/]+)/status
        inline bool parse_path_param(const httplib::Request &req, std::string &value)
        {
            if (req.matches.size() >= 2)
            {
                value = req.matches[1].str();
                return !value.empty();
            }
            return false;
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
        }

        // Helper: Send {"status": {...}} error envelope
        inline void send_error(httplib::Response &res, StatusCode code, const std::string &message)
        {
            send_json(res, code, make_error_response(code, message));
        }

        // Helper: Parse a JSON object body; empty body parses as {}
        inline bool parse_json_body(const httplib::Request &req, nlohmann::json &body, std::string &error)
        {
            if (req.body.empty())
            {
                body = nlohmann::json::object();
                return true;
            }
            try
            {
                body = nlohmann::json::parse(req.body);
            }
            catch (const nlohmann::json::parse_error &e)
            {
                error = std::string("Invalid JSON: ") + e.what();
                return false;
            }
            if (!body.is_object())
            {
                error = "Request body must be a JSON object";
                return false;
            }
            return true;
        }

    } // namespace http
} // namespace hostlink

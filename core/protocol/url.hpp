#pragma once

#include <map>
#include <string>

namespace hostlink {
namespace protocol {

// RFC 3986 unreserved characters pass through, everything else is %XX
std::string percent_encode(const std::string &value);

// '+' decodes to space; malformed escapes are kept literally
std::string percent_decode(const std::string &value);

// "a=1&b=x%20y" -> {a: "1", b: "x y"}; keys without '=' map to ""
std::map<std::string, std::string> parse_query_string(const std::string &query);

// "<server_url><path>?userId=..&type=agent&pid=..[&token=..]"
std::string build_agent_url(const std::string &server_url, const std::string &path, const std::string &user_id,
                            long pid, const std::string &token);

}  // namespace protocol
}  // namespace hostlink

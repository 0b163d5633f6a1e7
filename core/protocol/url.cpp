#include "url.hpp"

#include <cctype>

namespace hostlink {
namespace protocol {

namespace {
int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}  // namespace

std::string percent_encode(const std::string &value) {
    static const char *kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string percent_decode(const std::string &value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 &&
                   hex_value(value[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query_string(const std::string &query) {
    std::map<std::string, std::string> params;
    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        const std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            const size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                params[percent_decode(pair)] = "";
            } else {
                params[percent_decode(pair.substr(0, eq))] = percent_decode(pair.substr(eq + 1));
            }
        }
        start = end + 1;
    }
    return params;
}

std::string build_agent_url(const std::string &server_url, const std::string &path, const std::string &user_id,
                            long pid, const std::string &token) {
    std::string base = server_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    std::string url = base + path + "?userId=" + percent_encode(user_id) + "&type=agent&pid=" + std::to_string(pid);
    if (!token.empty()) {
        url += "&token=" + percent_encode(token);
    }
    return url;
}

}  // namespace protocol
}  // namespace hostlink

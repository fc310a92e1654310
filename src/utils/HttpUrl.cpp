#include "utils/HttpUrl.h"
#include <regex>
#include <cctype>
#include <stdexcept>

std::optional<HttpUrl> HttpUrl::parse(const std::string& url) {
    static const std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        return std::nullopt;
    }
    HttpUrl out;
    out.isSsl = (match[1] == "https");
    out.host = match[2];
    if (match[3].matched) {
        try {
            out.port = std::stoi(match[3]);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    } else {
        out.port = out.isSsl ? 443 : 80;
    }
    out.path = match[4];
    return out;
}

std::string urlEncodeComponent(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' || c == '~' ||
            c == '*' || c == '\'' || c == '(' || c == ')') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

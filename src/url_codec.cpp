#include "url_codec.hpp"

#include <iomanip>
#include <sstream>

namespace tokenward {

namespace {

bool IsUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string UrlCodec::Encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;
    for (unsigned char c : value) {
        if (IsUnreserved(c)) {
            escaped << c;
        } else if (c == ' ') {
            escaped << '+';
        } else {
            escaped << '%' << std::uppercase << std::setw(2) << int(c) << std::nouppercase;
        }
    }
    return escaped.str();
}

std::string UrlCodec::Decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());

    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (c == '+') {
            decoded.push_back(' ');
        } else if (c == '%' && i + 2 < value.size()) {
            int hi = HexValue(value[i + 1]);
            int lo = HexValue(value[i + 2]);
            if (hi < 0 || lo < 0) {
                decoded.push_back(c);
                continue;
            }
            decoded.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            decoded.push_back(c);
        }
    }
    return decoded;
}

QueryParams UrlCodec::ParseQueryString(const std::string& query) {
    QueryParams params;

    size_t pos = (!query.empty() && query[0] == '?') ? 1 : 0;
    while (pos < query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string::npos) {
            amp = query.size();
        }

        auto pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string key = Decode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? std::string() : Decode(pair.substr(eq + 1));
            if (!key.empty()) {
                params.emplace(std::move(key), std::move(value));
            }
        }
        pos = amp + 1;
    }
    return params;
}

std::string UrlCodec::BuildFormBody(const FormFields& fields) {
    std::string body;
    for (const auto& field : fields) {
        if (!body.empty()) {
            body += "&";
        }
        body += Encode(field.first) + "=" + Encode(field.second);
    }
    return body;
}

std::string UrlCodec::AppendQuery(const std::string& url, const FormFields& fields) {
    auto query = BuildFormBody(fields);
    if (query.empty()) {
        return url;
    }
    auto separator = url.find('?') == std::string::npos ? "?" : "&";
    return url + separator + query;
}

} // namespace tokenward

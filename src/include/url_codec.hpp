#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tokenward {

using QueryParams = std::map<std::string, std::string>;
using FormFields = std::vector<std::pair<std::string, std::string>>;

class UrlCodec {
public:
    // Leaves RFC 3986 unreserved characters as they are, space becomes '+',
    // everything else %XX with upper-case hex digits.
    static std::string Encode(const std::string& value);

    // %XX becomes the byte, '+' becomes a space; malformed escapes are kept literally
    static std::string Decode(const std::string& value);

    // Accepts "a=1&b=2" with or without a leading '?'. The first occurrence of a key wins.
    static QueryParams ParseQueryString(const std::string& query);

    // application/x-www-form-urlencoded body, fields kept in the given order
    static std::string BuildFormBody(const FormFields& fields);

    // Appends encoded fields to a URL, using '&' when it already has a query
    static std::string AppendQuery(const std::string& url, const FormFields& fields);
};

} // namespace tokenward

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace chunknet::net {

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string url_encode(std::string_view text);

// nullopt on a malformed escape. '+' decodes to a space only when plus_as_space is set.
std::optional<std::string> url_decode(std::string_view text, bool plus_as_space = false);

// "a=1&b=two" -> {a:1, b:two}; later duplicates win, malformed pairs are skipped.
std::map<std::string, std::string> parse_query(std::string_view query);

}  // namespace chunknet::net

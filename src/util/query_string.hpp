/**
 * SHOTGATE - Signed Screenshot Gateway
 * Query String - request-target splitting and percent encoding
 */

#ifndef SHOTGATE_UTIL_QUERY_STRING_HPP
#define SHOTGATE_UTIL_QUERY_STRING_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shotgate::util {

/**
 * Decoded query parameters in request order
 *
 * Lookup returns the first occurrence of a name, duplicates are kept so the
 * original order is preserved for logging.
 */
class QueryParams {
public:
    QueryParams() = default;

    /**
     * Parse an application/x-www-form-urlencoded query (without leading '?')
     * '+' decodes to a space and malformed %-escapes are kept literally.
     */
    static QueryParams parse(std::string_view query);

    bool has(std::string_view name) const;

    /**
     * First value for name, nullopt when absent
     */
    std::optional<std::string> get(std::string_view name) const;

    /**
     * First value for name, or fallback when absent or empty
     */
    std::string get_or(std::string_view name, std::string_view fallback) const;

    void add(std::string name, std::string value);

    std::size_t size() const { return params_.size(); }
    bool empty() const { return params_.empty(); }

private:
    std::vector<std::pair<std::string, std::string>> params_;
};

/**
 * Request target split at the first '?'
 */
struct RequestTarget {
    std::string path;
    std::string query;
};

RequestTarget split_target(std::string_view target);

/**
 * Decode %XX escapes; when plus_as_space is set '+' becomes ' '
 */
std::string percent_decode(std::string_view input, bool plus_as_space);

/**
 * Percent-encode every byte outside A-Z a-z 0-9 - _ . ! ~ * ' ( )
 *
 * Same unreserved set as ECMAScript encodeURIComponent, applied to the raw
 * UTF-8 bytes with uppercase hex digits.
 */
std::string percent_encode_component(std::string_view input);

/**
 * Join name=value pairs with '&', both sides percent-encoded
 */
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

} // namespace shotgate::util

#endif // SHOTGATE_UTIL_QUERY_STRING_HPP

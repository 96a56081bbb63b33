/**
 * SHOTGATE - Signed Screenshot Gateway
 * Request Parameters - validation of inbound screenshot parameters
 *
 * Turns the raw query strings (url, version, sig, w, h, js, css) into an
 * immutable RequestDescriptor, or reports the first rule that failed.
 */

#ifndef SHOTGATE_AUTH_REQUEST_PARAMS_HPP
#define SHOTGATE_AUTH_REQUEST_PARAMS_HPP

#include "util/query_string.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace shotgate::auth {

constexpr int kMinWidth = 100;
constexpr int kMaxWidth = 3840;
constexpr int kMinHeight = 100;
constexpr int kMaxHeight = 2160;

constexpr std::string_view kDefaultWidth = "1200";
constexpr std::string_view kDefaultHeight = "800";
constexpr std::string_view kFullHeight = "full";

/**
 * Raw parameters as received; nullopt means the name was absent
 */
struct RawParams {
    std::optional<std::string> url;
    std::optional<std::string> version;
    std::optional<std::string> sig;
    std::optional<std::string> w;
    std::optional<std::string> h;
    std::optional<std::string> js;
    std::optional<std::string> css;

    static RawParams from_query(const util::QueryParams& query);
};

/**
 * Validated screenshot request
 */
struct RequestDescriptor {
    std::string target_url;
    std::string version;
    int width{1200};
    std::optional<int> height{800};  // nullopt = "full"
    std::string injected_js;
    std::string injected_css;

    bool full_page() const { return !height.has_value(); }

    /**
     * Canonical width string: decimal rendering of width
     */
    std::string width_string() const;

    /**
     * Canonical height string: "full" or decimal rendering of height
     */
    std::string height_string() const;

    bool operator==(const RequestDescriptor&) const = default;
};

/**
 * Why a request was refused before authentication
 */
enum class RejectReason : std::uint8_t {
    MissingParameter,
    InvalidUrl,
    InvalidWidth,
    InvalidHeight
};

/**
 * Descriptor plus the caller's signature
 */
struct ValidatedRequest {
    RequestDescriptor descriptor;
    std::string signature;
};

using ValidationResult = std::variant<ValidatedRequest, RejectReason>;

/**
 * Validate raw parameters
 *
 * Rules, checked in order:
 * - url, version and sig must be present and non-empty
 * - url must be an absolute URI
 * - w (default 1200) must be a decimal integer in [100, 3840]
 * - h (default 800) must be "full" or a decimal integer in [100, 2160]
 * js and css default to empty and are not inspected.
 */
ValidationResult validate_params(const RawParams& raw);

/**
 * Absolute URI check: RFC 3986 scheme followed by ':' and a non-empty rest.
 * http, https, ws, wss and ftp also require a non-empty authority after "//".
 * Spaces are allowed inside the path, query and fragment only; control
 * characters are rejected everywhere.
 */
bool is_absolute_uri(std::string_view candidate);

/**
 * Strict decimal parse: digits only, no sign, no whitespace, fits in int
 */
std::optional<int> parse_decimal(std::string_view text);

/**
 * Client-facing text for a rejection (400 body)
 */
std::string_view reject_message(RejectReason reason);

std::string_view to_string(RejectReason reason);

} // namespace shotgate::auth

#endif // SHOTGATE_AUTH_REQUEST_PARAMS_HPP

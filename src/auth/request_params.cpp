/**
 * SHOTGATE - Signed Screenshot Gateway
 * Request Parameters Implementation
 */

#include "auth/request_params.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace shotgate::auth {

namespace {

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool has_empty(const std::optional<std::string>& value) {
    return !value || value->empty();
}

} // anonymous namespace

RawParams RawParams::from_query(const util::QueryParams& query) {
    RawParams raw;
    raw.url = query.get("url");
    raw.version = query.get("version");
    raw.sig = query.get("sig");
    raw.w = query.get("w");
    raw.h = query.get("h");
    raw.js = query.get("js");
    raw.css = query.get("css");
    return raw;
}

std::string RequestDescriptor::width_string() const {
    return std::to_string(width);
}

std::string RequestDescriptor::height_string() const {
    return height ? std::to_string(*height) : std::string(kFullHeight);
}

bool is_absolute_uri(std::string_view candidate) {
    auto colon = candidate.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }

    auto scheme = candidate.substr(0, colon);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    if (!std::all_of(scheme.begin(), scheme.end(), is_scheme_char)) {
        return false;
    }

    auto rest = candidate.substr(colon + 1);
    if (rest.empty()) {
        return false;
    }

    // Interior spaces pass; a trailing space or any control character does not
    if (candidate.back() == ' ') {
        return false;
    }
    for (char c : candidate) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F) {
            return false;
        }
    }

    static constexpr std::array<std::string_view, 5> hierarchical = {
        "http", "https", "ws", "wss", "ftp"
    };
    auto lower = lowercase(scheme);
    if (std::find(hierarchical.begin(), hierarchical.end(), lower) != hierarchical.end()) {
        // Authority is everything after the slashes up to the path/query/fragment
        auto authority = rest;
        while (!authority.empty() && (authority.front() == '/' || authority.front() == '\\')) {
            authority.remove_prefix(1);
        }
        auto end = authority.find_first_of("/?#\\");
        if (end != std::string_view::npos) {
            authority = authority.substr(0, end);
        }
        auto at = authority.rfind('@');
        if (at != std::string_view::npos) {
            authority = authority.substr(at + 1);
        }
        // Host must be non-empty; a trailing ":port" must be numeric
        auto port_sep = authority.rfind(':');
        auto bracket = authority.rfind(']');
        std::string_view host = authority;
        if (port_sep != std::string_view::npos &&
            (bracket == std::string_view::npos || port_sep > bracket)) {
            auto port = authority.substr(port_sep + 1);
            if (!std::all_of(port.begin(), port.end(),
                             [](unsigned char c) { return std::isdigit(c); })) {
                return false;
            }
            host = authority.substr(0, port_sep);
        }
        if (host.empty() || host.find(' ') != std::string_view::npos) {
            return false;
        }
    }

    return true;
}

std::optional<int> parse_decimal(std::string_view text) {
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }

    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

ValidationResult validate_params(const RawParams& raw) {
    if (has_empty(raw.url) || has_empty(raw.version) || has_empty(raw.sig)) {
        return RejectReason::MissingParameter;
    }

    if (!is_absolute_uri(*raw.url)) {
        return RejectReason::InvalidUrl;
    }

    std::string_view width_text = has_empty(raw.w) ? kDefaultWidth : std::string_view(*raw.w);
    auto width = parse_decimal(width_text);
    if (!width || *width < kMinWidth || *width > kMaxWidth) {
        return RejectReason::InvalidWidth;
    }

    std::string_view height_text = has_empty(raw.h) ? kDefaultHeight : std::string_view(*raw.h);
    std::optional<int> height;
    if (height_text != kFullHeight) {
        height = parse_decimal(height_text);
        if (!height || *height < kMinHeight || *height > kMaxHeight) {
            return RejectReason::InvalidHeight;
        }
    }

    ValidatedRequest result;
    result.descriptor.target_url = *raw.url;
    result.descriptor.version = *raw.version;
    result.descriptor.width = *width;
    result.descriptor.height = height;
    result.descriptor.injected_js = raw.js.value_or("");
    result.descriptor.injected_css = raw.css.value_or("");
    result.signature = *raw.sig;
    return result;
}

std::string_view reject_message(RejectReason reason) {
    switch (reason) {
        case RejectReason::MissingParameter: return "Missing required parameters";
        case RejectReason::InvalidUrl:       return "Invalid url";
        case RejectReason::InvalidWidth:     return "Invalid w (100-3840)";
        case RejectReason::InvalidHeight:    return "Invalid h (100-2160 or \"full\")";
    }
    return "Bad request";
}

std::string_view to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::MissingParameter: return "missing_parameter";
        case RejectReason::InvalidUrl:       return "invalid_url";
        case RejectReason::InvalidWidth:     return "invalid_width";
        case RejectReason::InvalidHeight:    return "invalid_height";
    }
    return "unknown";
}

} // namespace shotgate::auth

/**
 * SHOTGATE - Signed Screenshot Gateway
 * Query String Implementation
 */

#include "util/query_string.hpp"

namespace shotgate::util {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_unreserved(unsigned char c) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '-': case '_': case '.': case '!':
        case '~': case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

QueryParams QueryParams::parse(std::string_view query) {
    QueryParams result;

    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string_view::npos) {
            amp = query.size();
        }

        auto pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                result.add(percent_decode(pair, true), std::string{});
            } else {
                result.add(percent_decode(pair.substr(0, eq), true),
                           percent_decode(pair.substr(eq + 1), true));
            }
        }

        pos = amp + 1;
    }

    return result;
}

bool QueryParams::has(std::string_view name) const {
    for (const auto& [key, value] : params_) {
        if (key == name) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> QueryParams::get(std::string_view name) const {
    for (const auto& [key, value] : params_) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::string QueryParams::get_or(std::string_view name, std::string_view fallback) const {
    auto value = get(name);
    if (!value || value->empty()) {
        return std::string(fallback);
    }
    return *value;
}

void QueryParams::add(std::string name, std::string value) {
    params_.emplace_back(std::move(name), std::move(value));
}

RequestTarget split_target(std::string_view target) {
    RequestTarget result;
    auto q = target.find('?');
    if (q == std::string_view::npos) {
        result.path = std::string(target);
    } else {
        result.path = std::string(target.substr(0, q));
        result.query = std::string(target.substr(q + 1));
    }
    if (result.path.empty()) {
        result.path = "/";
    }
    return result;
}

std::string percent_decode(std::string_view input, bool plus_as_space) {
    std::string out;
    out.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
            out.push_back(c);
        } else if (c == '+' && plus_as_space) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }

    return out;
}

std::string percent_encode_component(std::string_view input) {
    static constexpr char hex_chars[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(input.size());

    for (char ch : input) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hex_chars[c >> 4]);
            out.push_back(hex_chars[c & 0x0F]);
        }
    }

    return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string out;
    for (const auto& [name, value] : params) {
        if (!out.empty()) {
            out.push_back('&');
        }
        out += percent_encode_component(name);
        out.push_back('=');
        out += percent_encode_component(value);
    }
    return out;
}

} // namespace shotgate::util

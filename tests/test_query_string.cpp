#include "util/query_string.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

using namespace shotgate;

namespace {

bool test_parse_basic() {
    auto q = util::QueryParams::parse("a=1&b=two&c=");
    if (q.size() != 3) return false;
    if (q.get("a") != "1") return false;
    if (q.get("b") != "two") return false;
    if (!q.has("c")) return false;
    if (q.get("c") != "") return false;
    if (q.has("d")) return false;
    if (q.get("d")) return false;
    return true;
}

bool test_form_decoding() {
    auto q = util::QueryParams::parse("css=h1+%7Bcolor%3A+red%7D&url=https%3A%2F%2Fa.b%2F%3Fx%3D1%26y%3D2");
    if (q.get("css") != "h1 {color: red}") return false;
    if (q.get("url") != "https://a.b/?x=1&y=2") return false;

    // Malformed escapes pass through untouched
    auto bad = util::QueryParams::parse("x=%zz&y=100%");
    if (bad.get("x") != "%zz") return false;
    if (bad.get("y") != "100%") return false;

    return true;
}

bool test_first_duplicate_wins() {
    auto q = util::QueryParams::parse("w=800&w=1200");
    return q.get("w") == "800";
}

bool test_flag_without_value() {
    auto q = util::QueryParams::parse("url&&version=1");
    if (!q.has("url")) return false;
    if (q.get("url") != "") return false;
    if (q.get_or("url", "fallback") != "fallback") return false;
    if (q.get_or("version", "fallback") != "1") return false;
    if (q.size() != 2) return false;
    return true;
}

bool test_split_target() {
    auto t = util::split_target("/shot?url=x&w=1");
    if (t.path != "/shot" || t.query != "url=x&w=1") return false;

    auto no_query = util::split_target("/health");
    if (no_query.path != "/health" || !no_query.query.empty()) return false;

    auto bare = util::split_target("?url=x");
    if (bare.path != "/" || bare.query != "url=x") return false;

    return true;
}

bool test_percent_encode_component() {
    if (util::percent_encode_component("AZaz09-_.!~*'()") != "AZaz09-_.!~*'()") return false;
    if (util::percent_encode_component("a b/c?d=e&f") != "a%20b%2Fc%3Fd%3De%26f") return false;
    if (util::percent_encode_component("\xC3\xA9") != "%C3%A9") return false;
    if (!util::percent_encode_component("").empty()) return false;
    return true;
}

bool test_build_query_round_trip() {
    auto text = util::build_query({{"url", "https://x.y/?a=1"}, {"css", "h1 {}"}});
    if (text != "url=https%3A%2F%2Fx.y%2F%3Fa%3D1&css=h1%20%7B%7D") return false;

    auto q = util::QueryParams::parse(text);
    if (q.get("url") != "https://x.y/?a=1") return false;
    if (q.get("css") != "h1 {}") return false;
    return true;
}

} // anonymous namespace

int main() {
    if (!test_parse_basic()) {
        std::printf("test_parse_basic failed\n");
        return EXIT_FAILURE;
    }

    if (!test_form_decoding()) {
        std::printf("test_form_decoding failed\n");
        return EXIT_FAILURE;
    }

    if (!test_first_duplicate_wins()) {
        std::printf("test_first_duplicate_wins failed\n");
        return EXIT_FAILURE;
    }

    if (!test_flag_without_value()) {
        std::printf("test_flag_without_value failed\n");
        return EXIT_FAILURE;
    }

    if (!test_split_target()) {
        std::printf("test_split_target failed\n");
        return EXIT_FAILURE;
    }

    if (!test_percent_encode_component()) {
        std::printf("test_percent_encode_component failed\n");
        return EXIT_FAILURE;
    }

    if (!test_build_query_round_trip()) {
        std::printf("test_build_query_round_trip failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All query_string tests passed\n");
    return EXIT_SUCCESS;
}

/**
 * SHOTGATE - Signed Screenshot Gateway
 * Signature Verifier Implementation
 */

#include "auth/signature.hpp"
#include "util/logger.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace shotgate::auth {

namespace {

constexpr char kDelimiter = '|';

std::string to_hex(const unsigned char* data, std::size_t len) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(hex_chars[data[i] >> 4]);
        out.push_back(hex_chars[data[i] & 0x0F]);
    }
    return out;
}

std::string get_openssl_error_string() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return std::string(buf);
}

} // anonymous namespace

CompareResult constant_time_compare(std::string_view a, std::string_view b) noexcept {
    CompareResult result;
    if (a.size() != b.size()) {
        return result;
    }

    unsigned int diff = 0;
    std::size_t i = 0;
    for (; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i]) ^ static_cast<unsigned char>(b[i]);
    }

    result.equal = (diff == 0);
    result.positions_checked = i;
    return result;
}

std::string canonical_message(const RequestDescriptor& descriptor) {
    std::string msg;
    msg.reserve(descriptor.target_url.size() + descriptor.version.size() +
                descriptor.injected_js.size() + descriptor.injected_css.size() + 16);

    msg += descriptor.target_url;
    msg += kDelimiter;
    msg += descriptor.version;
    msg += kDelimiter;
    msg += descriptor.width_string();
    msg += kDelimiter;
    msg += descriptor.height_string();
    msg += kDelimiter;
    msg += descriptor.injected_js;
    msg += kDelimiter;
    msg += descriptor.injected_css;
    return msg;
}

std::string hmac_sha256_hex(std::string_view secret, std::string_view message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    const unsigned char* out = HMAC(
        EVP_sha256(),
        secret.data(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        digest, &digest_len);

    if (out == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed: " + get_openssl_error_string());
    }

    return to_hex(digest, digest_len);
}

SignatureVerifier::SignatureVerifier(std::string secret)
    : secret_(std::move(secret))
{
    if (secret_.empty()) {
        throw std::invalid_argument("Signature secret must not be empty");
    }

    // First 8 hex chars of HMAC(secret, "fingerprint"); safe to log
    fingerprint_ = hmac_sha256_hex(secret_, "fingerprint").substr(0, 8);
    SHOTGATE_LOG_DEBUG(util::log_component::Auth,
                       "Signature verifier ready (secret fingerprint {})", fingerprint_);
}

std::string SignatureVerifier::sign(const RequestDescriptor& descriptor) const {
    return hmac_sha256_hex(secret_, canonical_message(descriptor));
}

bool SignatureVerifier::verify(const RequestDescriptor& descriptor,
                               std::string_view signature) const {
    auto expected = sign(descriptor);
    return constant_time_equals(signature, expected);
}

} // namespace shotgate::auth

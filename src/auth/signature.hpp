/**
 * SHOTGATE - Signed Screenshot Gateway
 * Signature Verifier - HMAC-SHA256 request authentication
 *
 * A request is authorized when its sig parameter equals the lowercase hex
 * HMAC-SHA256 of the canonical message, keyed by the shared secret:
 *
 *     url|version|width|height|js|css
 *
 * width and height are the canonical (post-default, validated) strings.
 */

#ifndef SHOTGATE_AUTH_SIGNATURE_HPP
#define SHOTGATE_AUTH_SIGNATURE_HPP

#include "auth/request_params.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace shotgate::auth {

/**
 * Result of a constant-time comparison
 */
struct CompareResult {
    bool equal{false};
    std::size_t positions_checked{0};  // 0 when lengths differ
};

/**
 * Compare two strings without an early exit on the first mismatch
 *
 * Only a length mismatch returns early. Otherwise every position is XORed
 * into an accumulator, so the work done does not depend on where the inputs
 * first differ.
 */
CompareResult constant_time_compare(std::string_view a, std::string_view b) noexcept;

inline bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    return constant_time_compare(a, b).equal;
}

/**
 * Build the canonical message for a descriptor
 */
std::string canonical_message(const RequestDescriptor& descriptor);

/**
 * Lowercase hex HMAC-SHA256 of message keyed by secret
 * @throws std::runtime_error if OpenSSL fails
 */
std::string hmac_sha256_hex(std::string_view secret, std::string_view message);

/**
 * Verifies request signatures against one shared secret
 *
 * Immutable after construction; rotate by building a new verifier.
 */
class SignatureVerifier {
public:
    using Ptr = std::shared_ptr<const SignatureVerifier>;

    /**
     * @throws std::invalid_argument if secret is empty
     */
    explicit SignatureVerifier(std::string secret);

    SignatureVerifier(const SignatureVerifier&) = delete;
    SignatureVerifier& operator=(const SignatureVerifier&) = delete;

    /**
     * Signature a trusted caller would attach to this descriptor
     */
    std::string sign(const RequestDescriptor& descriptor) const;

    /**
     * true if signature matches the descriptor under this secret
     */
    bool verify(const RequestDescriptor& descriptor, std::string_view signature) const;

    /**
     * Short, non-reversible tag identifying the secret in logs
     */
    const std::string& secret_fingerprint() const { return fingerprint_; }

private:
    std::string secret_;
    std::string fingerprint_;
};

} // namespace shotgate::auth

#endif // SHOTGATE_AUTH_SIGNATURE_HPP

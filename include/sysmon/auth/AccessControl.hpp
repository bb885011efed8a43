//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AccessControl.hpp
// Purpose: Bearer-token authentication and client IP allow-listing performed before JSON-RPC dispatch
//==========================================================================================================

#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "sysmon/auth/IpRules.hpp"

namespace sysmon::auth {

//==========================================================================================================
// AccessPolicy
// Purpose: Immutable gate configuration.
// Fields:
//   token: Shared bearer token every request must present.
//   allowedCidr: When set, the effective client IP must fall inside this range.
//   trustedProxies: Peers allowed to report the client IP through X-Forwarded-For.
//==========================================================================================================
struct AccessPolicy {
    std::string token;
    std::optional<CidrRule> allowedCidr;
    std::vector<CidrRule> trustedProxies;
};

//==========================================================================================================
// AuthContext
// Purpose: Outcome of a successful gate check, consumed once per request.
//==========================================================================================================
struct AuthContext {
    bool authenticated{false};
    IpAddress clientIp;
};

// Stable rejection identifiers, used as the HTTP error body code.
namespace RejectCodes {
    constexpr const char* MissingToken = "missing_token";
    constexpr const char* InvalidToken = "invalid_token";
    constexpr const char* IpRestricted = "ip_restricted";
}

//==========================================================================================================
// AccessCheckResult
// Purpose: Result of AccessGate::Check.
// Fields:
//   ok: True if the request may proceed.
//   httpStatus: 401 or 403 on failure.
//   code/message: Error body members on failure.
//   includeWWWAuthenticate: Whether a WWW-Authenticate challenge belongs on the response.
//   context: Populated when ok.
//==========================================================================================================
struct AccessCheckResult {
    bool ok{false};
    int httpStatus{401};
    std::string code;
    std::string message;
    bool includeWWWAuthenticate{false};
    AuthContext context;
};

//==========================================================================================================
// AccessGate
// Purpose: Applies an AccessPolicy to one inbound request. The token check runs first, then the IP check.
// Notes:
//   - Token comparison is HMAC-SHA256 of both sides under a per-process random key, compared with
//     CRYPTO_memcmp, so elapsed time does not depend on where the first mismatching byte sits.
//   - Rejections are logged at WARN with the reason code and peer address only.
//==========================================================================================================
class AccessGate {
public:
    explicit AccessGate(AccessPolicy policy);

    //==========================================================================================================
    // Check
    // Args:
    //   peer: Socket peer address of the connection.
    //   authorization: Authorization header value, std::nullopt when the header is absent.
    //   forwardedFor: X-Forwarded-For header value, std::nullopt when absent.
    // Returns:
    //   AccessCheckResult describing acceptance or the rejection.
    //==========================================================================================================
    AccessCheckResult Check(const IpAddress& peer,
                            const std::optional<std::string>& authorization,
                            const std::optional<std::string>& forwardedFor) const;

    // Constant-time equality of a presented token against the configured one.
    bool TokenMatches(const std::string& presented) const;

    //==========================================================================================================
    // ResolveClientIp
    // Purpose: Effective client address: the left-most X-Forwarded-For entry when the peer is a trusted
    //          proxy, otherwise the peer itself.
    // Returns:
    //   std::nullopt when the peer is trusted but the header is absent or its left-most entry is not an IP.
    //==========================================================================================================
    std::optional<IpAddress> ResolveClientIp(const IpAddress& peer,
                                             const std::optional<std::string>& forwardedFor) const;

private:
    using Digest = std::array<unsigned char, 32>;
    Digest keyedDigest(const std::string& data) const;

    AccessPolicy policy_;
    std::array<unsigned char, 32> hmacKey_{};
    Digest expected_{};
};

//==========================================================================================================
// ExtractBearerToken
// Purpose: Returns the credential of an "Bearer <token>" header (scheme matched case-insensitively,
//          surrounding whitespace trimmed). std::nullopt for other schemes or an empty credential.
//==========================================================================================================
std::optional<std::string> ExtractBearerToken(const std::string& header);

} // namespace sysmon::auth

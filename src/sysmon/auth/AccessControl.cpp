//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/auth/AccessControl.cpp
// Purpose: Access gate implementation (bearer token + IP allow-list)
//==========================================================================================================

#include <cctype>
#include <stdexcept>
#include <string>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include "sysmon/auth/AccessControl.hpp"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace sysmon::auth {

namespace {
    static bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    static bool startsWithBearer(const std::string& s) {
        const std::string pfx = "Bearer ";
        if (s.size() < pfx.size()) {
            return false;
        }
        for (size_t i = 0; i < pfx.size(); ++i) {
            if (!icaseEqual(s[i], pfx[i])) {
                return false;
            }
        }
        return true;
    }

    AccessCheckResult reject(int status, const char* code, const char* message, const IpAddress& peer) {
        LOG_WARN("authentication failure reason={} peer={}", code, peer.to_string());
        AccessCheckResult r;
        r.ok = false;
        r.httpStatus = status;
        r.code = code;
        r.message = message;
        r.includeWWWAuthenticate = (status == 401);
        return r;
    }
}

std::optional<std::string> ExtractBearerToken(const std::string& header) {
    const std::string h = TrimAscii(header);
    if (!startsWithBearer(h)) {
        return std::nullopt;
    }
    std::string token = TrimAscii(h.substr(7));
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

AccessGate::AccessGate(AccessPolicy policy) : policy_(std::move(policy)) {
    if (::RAND_bytes(hmacKey_.data(), static_cast<int>(hmacKey_.size())) != 1) {
        throw std::runtime_error("AccessGate: RAND_bytes failed to produce an HMAC key");
    }
    expected_ = keyedDigest(policy_.token);
}

AccessGate::Digest AccessGate::keyedDigest(const std::string& data) const {
    Digest out{};
    unsigned int len = 0;
    const unsigned char* ok = ::HMAC(::EVP_sha256(), hmacKey_.data(), static_cast<int>(hmacKey_.size()),
                                     reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                                     out.data(), &len);
    if (ok == nullptr || len != out.size()) {
        throw std::runtime_error("AccessGate: HMAC-SHA256 computation failed");
    }
    return out;
}

bool AccessGate::TokenMatches(const std::string& presented) const {
    // Both digests are fixed length; CRYPTO_memcmp touches every byte regardless of content.
    const Digest got = keyedDigest(presented);
    return ::CRYPTO_memcmp(got.data(), expected_.data(), expected_.size()) == 0;
}

std::optional<IpAddress> AccessGate::ResolveClientIp(const IpAddress& peer,
                                                     const std::optional<std::string>& forwardedFor) const {
    const IpAddress direct = NormalizeAddress(peer);
    if (!MatchesAny(policy_.trustedProxies, direct)) {
        return direct;
    }
    if (!forwardedFor.has_value()) {
        return std::nullopt;
    }
    const std::string& xff = forwardedFor.value();
    const std::string first = xff.substr(0, xff.find(','));
    auto addr = ParseAddress(first);
    if (!addr) {
        return std::nullopt;
    }
    return NormalizeAddress(*addr);
}

AccessCheckResult AccessGate::Check(const IpAddress& peer,
                                    const std::optional<std::string>& authorization,
                                    const std::optional<std::string>& forwardedFor) const {
    if (!authorization.has_value()) {
        return reject(401, RejectCodes::MissingToken, "missing bearer token", peer);
    }
    const auto token = ExtractBearerToken(authorization.value());
    // One digest per request, including non-bearer schemes.
    const bool matches = TokenMatches(token.value_or(std::string()));
    if (!token.has_value() || !matches) {
        return reject(401, RejectCodes::InvalidToken, "invalid bearer token", peer);
    }

    AccessCheckResult r;
    r.ok = true;
    r.httpStatus = 200;
    r.context.authenticated = true;
    r.context.clientIp = NormalizeAddress(peer);

    const auto client = ResolveClientIp(peer, forwardedFor);
    if (!policy_.allowedCidr.has_value()) {
        // No allow-list: an unusable forwarded header leaves the peer as the client.
        if (client.has_value()) {
            r.context.clientIp = *client;
        }
        return r;
    }
    if (!client.has_value() || !policy_.allowedCidr->Contains(*client)) {
        return reject(403, RejectCodes::IpRestricted, "client address is not allowed", peer);
    }
    r.context.clientIp = *client;
    return r;
}

} // namespace sysmon::auth

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/auth/IpRules.cpp
// Purpose: IP address and CIDR range parsing/matching
//==========================================================================================================

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <sstream>

#include "sysmon/auth/IpRules.hpp"
#include "env/EnvVars.h"

namespace sysmon::auth {

namespace {
    template <std::size_t N>
    void maskBytes(std::array<unsigned char, N>& bytes, unsigned int prefix) {
        for (std::size_t i = 0; i < N; ++i) {
            const unsigned int bitStart = static_cast<unsigned int>(i) * 8u;
            if (prefix >= bitStart + 8u) {
                continue;
            }
            if (prefix <= bitStart) {
                bytes[i] = 0;
            } else {
                const unsigned int keep = prefix - bitStart;
                bytes[i] = static_cast<unsigned char>(bytes[i] & static_cast<unsigned char>(0xFFu << (8u - keep)));
            }
        }
    }

    IpAddress maskAddress(const IpAddress& addr, unsigned int prefix) {
        if (addr.is_v4()) {
            auto bytes = addr.to_v4().to_bytes();
            maskBytes(bytes, prefix);
            return IpAddress(boost::asio::ip::address_v4(bytes));
        }
        auto bytes = addr.to_v6().to_bytes();
        maskBytes(bytes, prefix);
        return IpAddress(boost::asio::ip::address_v6(bytes));
    }

    bool parsePrefix(const std::string& s, unsigned int& out) {
        if (s.empty() || s.size() > 3) {
            return false;
        }
        if (!std::all_of(s.begin(), s.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
            return false;
        }
        out = static_cast<unsigned int>(std::stoul(s));
        return true;
    }
}

IpAddress NormalizeAddress(const IpAddress& addr) {
    if (addr.is_v6()) {
        const auto v6 = addr.to_v6();
        if (v6.is_v4_mapped()) {
            return IpAddress(boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, v6));
        }
    }
    return addr;
}

std::optional<IpAddress> ParseAddress(const std::string& text) {
    std::string t = TrimAscii(text);
    if (t.size() >= 2 && t.front() == '[' && t.back() == ']') {
        t = t.substr(1, t.size() - 2);
    }
    if (t.empty()) {
        return std::nullopt;
    }
    boost::system::error_code ec;
    IpAddress addr = boost::asio::ip::make_address(t, ec);
    if (ec) {
        return std::nullopt;
    }
    return addr;
}

bool CidrRule::Contains(const IpAddress& addr) const {
    const IpAddress a = NormalizeAddress(addr);
    if (a.is_v4() != network.is_v4()) {
        return false;
    }
    return maskAddress(a, prefixLength) == network;
}

std::string CidrRule::ToString() const {
    return std::format("{}/{}", network.to_string(), prefixLength);
}

std::optional<CidrRule> ParseCidr(const std::string& text) {
    const std::string t = TrimAscii(text);
    std::string addrPart = t;
    std::optional<unsigned int> prefix;
    const auto slash = t.find('/');
    if (slash != std::string::npos) {
        addrPart = t.substr(0, slash);
        unsigned int p = 0;
        if (!parsePrefix(t.substr(slash + 1), p)) {
            return std::nullopt;
        }
        prefix = p;
    }
    auto addr = ParseAddress(addrPart);
    if (!addr) {
        return std::nullopt;
    }
    // A v4-mapped range is matched as the IPv4 range it embeds.
    IpAddress base = *addr;
    if (base.is_v6() && base.to_v6().is_v4_mapped()) {
        base = NormalizeAddress(base);
        if (prefix.has_value()) {
            if (*prefix < 96) {
                return std::nullopt;
            }
            prefix = *prefix - 96;
        }
    }
    const unsigned int width = base.is_v4() ? 32u : 128u;
    const unsigned int len = prefix.value_or(width);
    if (len > width) {
        return std::nullopt;
    }
    CidrRule rule;
    rule.network = maskAddress(base, len);
    rule.prefixLength = len;
    return rule;
}

std::optional<std::vector<CidrRule>> ParseCidrList(const std::string& text, std::string& badItem) {
    std::vector<CidrRule> rules;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const std::string trimmed = TrimAscii(item);
        if (trimmed.empty()) {
            continue;
        }
        auto rule = ParseCidr(trimmed);
        if (!rule) {
            badItem = trimmed;
            return std::nullopt;
        }
        rules.push_back(*rule);
    }
    return rules;
}

bool MatchesAny(const std::vector<CidrRule>& rules, const IpAddress& addr) {
    return std::any_of(rules.begin(), rules.end(), [&addr](const CidrRule& r){ return r.Contains(addr); });
}

} // namespace sysmon::auth

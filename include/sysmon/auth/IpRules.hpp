//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IpRules.hpp
// Purpose: IP address and CIDR range parsing/matching used by the access gate
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/asio/ip/address.hpp>

namespace sysmon::auth {

using IpAddress = boost::asio::ip::address;

//==========================================================================================================
// CidrRule
// Purpose: One network range (address + prefix length). IPv4-mapped IPv6 addresses are compared as IPv4.
// Fields:
//   network: Base address with host bits cleared.
//   prefixLength: Number of leading network bits (0..32 for IPv4, 0..128 for IPv6).
//==========================================================================================================
struct CidrRule {
    IpAddress network;
    unsigned int prefixLength{0};

    // True when addr lies inside this range. Addresses of a different family never match.
    bool Contains(const IpAddress& addr) const;

    // Renders as "<network>/<prefix>".
    std::string ToString() const;
};

//==========================================================================================================
// NormalizeAddress
// Purpose: Converts an IPv4-mapped IPv6 address (::ffff:a.b.c.d) to plain IPv4; others are returned as is.
//==========================================================================================================
IpAddress NormalizeAddress(const IpAddress& addr);

//==========================================================================================================
// ParseAddress
// Purpose: Parses a textual IP address after trimming whitespace. A bracketed IPv6 literal ("[::1]") is
//          accepted. Returns std::nullopt when the text is not an address.
//==========================================================================================================
std::optional<IpAddress> ParseAddress(const std::string& text);

//==========================================================================================================
// ParseCidr
// Purpose: Parses "a.b.c.d/n", "x:y::/n" or a bare address (treated as a single host).
// Returns:
//   CidrRule on success; std::nullopt on malformed address, prefix, or prefix beyond the family width.
//==========================================================================================================
std::optional<CidrRule> ParseCidr(const std::string& text);

//==========================================================================================================
// ParseCidrList
// Purpose: Parses a comma-separated list of CIDR rules. Empty items are skipped.
// Args:
//   text: Raw list text.
//   badItem: Set to the first offending item when parsing fails.
// Returns:
//   Parsed rules, or std::nullopt when any item is invalid.
//==========================================================================================================
std::optional<std::vector<CidrRule>> ParseCidrList(const std::string& text, std::string& badItem);

// True when any rule contains addr.
bool MatchesAny(const std::vector<CidrRule>& rules, const IpAddress& addr);

} // namespace sysmon::auth

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.hpp
// Purpose: URL splitting, form encoding and query-string parsing helpers
//==========================================================================================================
#pragma once

#include <map>
#include <string>
#include <vector>

namespace monzo::util {

// Query parameter name -> values in arrival order (names may repeat).
using QueryParameters = std::map<std::string, std::vector<std::string>>;

struct FormField { std::string name; std::string value; };
using FormFields = std::vector<FormField>;

struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // defaulted from the scheme when absent
    std::string target;   // path plus query, always starting with '/'
};

// application/x-www-form-urlencoded escaping (space becomes '+').
std::string urlEncodeForm(const std::string& s);

// Reverses urlEncodeForm: %XX sequences and '+' are decoded; malformed escapes are kept literally.
std::string urlDecode(const std::string& s);

// name=value&name=value, each side encoded with urlEncodeForm.
std::string encodeForm(const FormFields& fields);

//==========================================================================================================
// parseQueryString
// Purpose: Splits a raw query (without '?') into decoded parameters.
// Notes:
//   Pairs with an empty value, or without '=', are skipped.
//==========================================================================================================
QueryParameters parseQueryString(const std::string& query);

// Extracts and parses the query component of a request target such as "/cb?code=x&state=y#frag".
QueryParameters parseQueryFromTarget(const std::string& target);

// Splits an absolute http(s) URL. Throws errors::MonzoError(InvalidArgument) on an unsupported
// scheme or a missing host.
UrlParts parseUrl(const std::string& url);

// Appends "?query" (or "&query" when the URL already has one) unless query is empty.
std::string appendQuery(const std::string& url, const std::string& query);

} // namespace monzo::util

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.cpp
// Purpose: URL splitting, form encoding and query-string parsing helpers
//==========================================================================================================

#include <sstream>
#include "monzo/util/Url.hpp"
#include "monzo/errors/Errors.h"

namespace monzo::util {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

} // namespace

std::string urlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string urlDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() && hexValue(s[i + 1]) >= 0 && hexValue(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>((hexValue(s[i + 1]) << 4) | hexValue(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string encodeForm(const FormFields& fields) {
    std::ostringstream form;
    bool first = true;
    for (const auto& f : fields) {
        if (!first) form << '&';
        first = false;
        form << urlEncodeForm(f.name) << '=' << urlEncodeForm(f.value);
    }
    return form.str();
}

QueryParameters parseQueryString(const std::string& query) {
    QueryParameters params;
    std::size_t pos = 0;
    while (pos <= query.size()) {
        std::size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        pos = amp + 1;
        std::size_t eq = pair.find('=');
        if (eq == std::string::npos || eq + 1 == pair.size()) {
            continue;
        }
        params[urlDecode(pair.substr(0, eq))].push_back(urlDecode(pair.substr(eq + 1)));
    }
    return params;
}

QueryParameters parseQueryFromTarget(const std::string& target) {
    std::string t = target;
    std::size_t hash = t.find('#');
    if (hash != std::string::npos) t.erase(hash);
    std::size_t q = t.find('?');
    if (q == std::string::npos) return QueryParameters{};
    return parseQueryString(t.substr(q + 1));
}

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw errors::MonzoError(errors::ErrorKind::InvalidArgument, "URL has no scheme: " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw errors::MonzoError(errors::ErrorKind::InvalidArgument, "Unsupported URL scheme: " + parts.scheme);
    }
    pos = schemeEnd + 3;
    std::size_t slash = url.find_first_of("/?", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.target = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.target = url.substr(slash);
        if (parts.target.front() == '?') parts.target.insert(parts.target.begin(), '/');
    }
    std::size_t hash = parts.target.find('#');
    if (hash != std::string::npos) parts.target.erase(hash);
    std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos || hostPort.find(']', colon) != std::string::npos) {
        parts.host = hostPort;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    if (parts.host.size() > 2 && parts.host.front() == '[' && parts.host.back() == ']') {
        parts.host = parts.host.substr(1, parts.host.size() - 2);
    }
    if (parts.host.empty()) {
        throw errors::MonzoError(errors::ErrorKind::InvalidArgument, "URL has no host: " + url);
    }
    return parts;
}

std::string appendQuery(const std::string& url, const std::string& query) {
    if (query.empty()) return url;
    return url + (url.find('?') == std::string::npos ? "?" : "&") + query;
}

} // namespace monzo::util

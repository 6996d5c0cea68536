//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version and User-Agent strings.
//==========================================================================================================
#include "monzo/version.h"

#include <sstream>

namespace monzo {

VersionInfo getVersion() {
    auto v = VersionInfo{0, 1, 0};
    return v;
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

std::string getUserAgent() {
    return std::string("monzo-cpp/") + getVersionString();
}

} // namespace monzo

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the monzo-cpp client library (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace monzo {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Returns the library semantic version components.
VersionInfo getVersion();

// Returns the semantic version formatted as "MAJOR.MINOR.PATCH".
std::string getVersionString();

// Returns the User-Agent product token sent on every API request ("monzo-cpp/MAJOR.MINOR.PATCH").
std::string getUserAgent();

} // namespace monzo

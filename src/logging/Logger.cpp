//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members; initial level from MONZO_LOG_LEVEL and optional file
//          sink from MONZO_LOG_FILE.
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("MONZO_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {
// Runs after the members above (same translation unit, declaration order)
[[maybe_unused]] const bool sLogFileConfigured = []() {
    const std::string path = GetEnvOrDefault("MONZO_LOG_FILE", "");
    if (path.empty()) {
        return false;
    }
    Logger::setLogFile(path);
    return true;
}();
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RandomString.cpp
// Purpose: OpenSSL-backed random token generation with rejection sampling
//==========================================================================================================

#include <array>
#include <openssl/err.h>
#include <openssl/rand.h>
#include "monzo/util/RandomString.hpp"
#include "monzo/errors/Errors.h"
#include "logging/Logger.h"

namespace monzo::util {

const std::string& randomAlphabet() {
    static const std::string alphabet("ABCDEFGHJKLMNPQRSTUVWXYZabcdefghjkmnpqrstuvwxyz23456789");
    return alphabet;
}

std::string randomString(std::size_t length) {
    const std::string& alphabet = randomAlphabet();
    // Largest multiple of the alphabet size that fits in a byte; bytes at or above it are rejected.
    const unsigned int limit = 256u - (256u % static_cast<unsigned int>(alphabet.size()));

    std::string out;
    out.reserve(length);
    std::array<unsigned char, 64> buf{};
    while (out.size() < length) {
        if (::RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
            unsigned long err = ::ERR_get_error();
            LOG_ERROR("RAND_bytes failed (openssl error {})", err);
            throw errors::MonzoError(errors::ErrorKind::Transport, "Secure random generator unavailable");
        }
        for (unsigned char b : buf) {
            if (out.size() == length) break;
            if (b >= limit) continue;
            out.push_back(alphabet[b % alphabet.size()]);
        }
    }
    return out;
}

} // namespace monzo::util

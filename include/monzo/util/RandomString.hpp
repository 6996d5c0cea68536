//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RandomString.hpp
// Purpose: Cryptographically secure random tokens (CSRF state, pot dedupe ids)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <string>

namespace monzo::util {

// Characters tokens are drawn from. Visually confusable characters (0 1 I O i l o) are excluded.
const std::string& randomAlphabet();

//==========================================================================================================
// randomString
// Purpose: Returns `length` characters drawn uniformly from randomAlphabet() using OpenSSL's CSPRNG.
// Throws:
//   errors::MonzoError(Transport) when the CSPRNG cannot supply bytes.
//==========================================================================================================
std::string randomString(std::size_t length);

} // namespace monzo::util

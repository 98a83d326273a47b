// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/**
 * The number of random bytes in a token generated by
 * GenerateCsrfToken().
 */
static constexpr std::size_t CSRF_TOKEN_BYTES = 32;

/**
 * The length of a token string generated by GenerateCsrfToken()
 * (unpadded URL-safe base64 of #CSRF_TOKEN_BYTES).
 */
static constexpr std::size_t CSRF_TOKEN_LENGTH = (CSRF_TOKEN_BYTES * 4 + 2) / 3;

/**
 * Generate a new random token from a cryptographically secure source
 * (libsodium's randombytes_buf()).  The result consists only of
 * characters which are allowed in URLs and cookie values.
 */
std::string
GenerateCsrfToken();

/**
 * Compare the expected token with the one supplied by the client.
 * The execution time depends only on the length of the expected
 * token, never on the position of the first differing byte.  An
 * empty expected token never matches.
 */
[[gnu::pure]]
bool
CsrfTokensEqual(std::string_view expected, std::string_view supplied) noexcept;

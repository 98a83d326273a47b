// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Token.hxx"

#include <sodium/randombytes.h>
#include <sodium/utils.h>

#include <array>

std::string
GenerateCsrfToken()
{
	std::array<unsigned char, CSRF_TOKEN_BYTES> raw;
	randombytes_buf(raw.data(), raw.size());

	constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;

	/* sodium_bin2base64() writes a null terminator */
	std::array<char, sodium_base64_ENCODED_LEN(CSRF_TOKEN_BYTES, variant)> encoded;
	sodium_bin2base64(encoded.data(), encoded.size(),
			  raw.data(), raw.size(), variant);

	sodium_memzero(raw.data(), raw.size());

	return {encoded.data(), CSRF_TOKEN_LENGTH};
}

bool
CsrfTokensEqual(std::string_view expected, std::string_view supplied) noexcept
{
	if (expected.empty())
		return false;

	/* if the lengths differ, compare the expected token with
	   itself, so the time spent is the same and only the length
	   is revealed */
	const bool same_length = supplied.size() == expected.size();
	const char *other = same_length ? supplied.data() : expected.data();

	const int result = sodium_memcmp(expected.data(), other,
					 expected.size());
	return same_length && result == 0;
}

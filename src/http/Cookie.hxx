// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Cookie syntax according to RFC 6265 4.1.1.
 */

#pragma once

#include <string_view>

class StringMap;

/**
 * May this character appear in a cookie name (an RFC 7230 "tchar")?
 */
constexpr bool
IsCookieNameChar(char ch) noexcept
{
	if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
	    (ch >= '0' && ch <= '9'))
		return true;

	switch (ch) {
	case '!': case '#': case '$': case '%': case '&': case '\'':
	case '*': case '+': case '-': case '.': case '^': case '_':
	case '`': case '|': case '~':
		return true;

	default:
		return false;
	}
}

/**
 * May this character appear in an unquoted cookie value (a
 * "cookie-octet")?
 */
constexpr bool
IsCookieOctet(char ch) noexcept
{
	return ch > 0x20 && ch < 0x7f &&
		ch != '"' && ch != ',' && ch != ';' && ch != '\\';
}

[[gnu::pure]]
bool
IsValidCookieName(std::string_view name) noexcept;

/**
 * Can this value be sent unquoted in a "Set-Cookie" header?  The
 * empty string is valid.
 */
[[gnu::pure]]
bool
IsValidCookieValue(std::string_view value) noexcept;

/**
 * Parse a "Cookie" request header and add all cookies to the given
 * map.  Double quotes around a value are removed.
 *
 * Browsers send values which violate RFC 6265 (with spaces, commas
 * or brackets); those are accepted, only control characters are not.
 * A malformed pair is skipped; the following ones are still parsed.
 */
void
ParseCookieHeader(StringMap &cookies, std::string_view header);

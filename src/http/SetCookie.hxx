// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * The "SameSite" cookie attribute.
 */
enum class CookieSameSite : uint8_t {
	/**
	 * Omit the attribute and let the browser decide.
	 */
	DEFAULT,

	STRICT,
	LAX,
	NONE,
};

/**
 * Parse a lower-case "SameSite" keyword ("default", "strict", "lax"
 * or "none").
 *
 * Throws std::invalid_argument on error.
 */
CookieSameSite
ParseCookieSameSite(std::string_view s);

/**
 * The attributes of a cookie to be sent to the client in a
 * "Set-Cookie" response header (RFC 6265 4.1).
 */
struct SetCookieParameters {
	std::string_view name, value;

	/**
	 * The "Domain" attribute; nullptr means it is omitted, which
	 * makes this a host-only cookie.
	 */
	const char *domain = nullptr;

	const char *path = "/";

	std::optional<std::chrono::seconds> max_age;

	CookieSameSite same_site = CookieSameSite::DEFAULT;

	bool secure = false;

	bool http_only = true;
};

/**
 * Format the value of a "Set-Cookie" response header.
 */
std::string
FormatSetCookie(const SetCookieParameters &p);

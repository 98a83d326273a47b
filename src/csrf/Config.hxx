// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Method.hxx"
#include "http/SetCookie.hxx"

#include <csrf-guard/Protocol.hxx>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * Which #CsrfPolicy implementation shall be created by
 * MakeCsrfPolicy()?
 */
enum class CsrfImplementation : uint8_t {
	/**
	 * Store the token in the session (#SessionCsrfPolicy).
	 */
	SESSION,

	/**
	 * Store the token in a cookie (#CookieCsrfPolicy).
	 */
	COOKIE,
};

/**
 * Throws on error.
 */
CsrfImplementation
ParseCsrfImplementation(std::string_view s);

struct CsrfCookieConfig {
	std::string name = CsrfGuard::DEFAULT_TOKEN_COOKIE;

	/**
	 * The "Domain" attribute; empty means host-only.
	 */
	std::string domain;

	std::string path = "/";

	std::optional<std::chrono::seconds> max_age;

	CookieSameSite same_site = CookieSameSite::DEFAULT;
};

/**
 * Configuration of the CSRF protection.
 */
struct CsrfConfig {
	CsrfImplementation implementation = CsrfImplementation::SESSION;

	CsrfCookieConfig cookie;

	/**
	 * The name of the form field which contains the token; empty
	 * disables looking at the request body.
	 */
	std::string token_field = CsrfGuard::DEFAULT_TOKEN_FIELD;

	/**
	 * The name of the request header which contains the token;
	 * empty disables looking at request headers.
	 */
	std::string header_name = CsrfGuard::DEFAULT_TOKEN_HEADER;

	/**
	 * Additional origins ("host" or "host:port") which are trusted
	 * by CheckCsrfOrigin().  The request's own host is always
	 * trusted.  An entry beginning with a dot matches the domain
	 * and all of its subdomains.
	 */
	std::vector<std::string> trusted_origins;

	/**
	 * Requests with these methods are never checked
	 * automatically.
	 */
	std::vector<HttpMethod> safe_methods{
		HttpMethod::GET,
		HttpMethod::HEAD,
		HttpMethod::OPTIONS,
		HttpMethod::TRACE,
	};

	/**
	 * Check all requests with an unsafe method automatically?
	 */
	bool require_csrf = false;

	/**
	 * Check the origin of secure requests before checking the
	 * token in automatic checks?
	 */
	bool check_origin = true;

	const char *GetTokenField() const noexcept {
		return token_field.empty() ? nullptr : token_field.c_str();
	}

	const char *GetHeaderName() const noexcept {
		return header_name.empty() ? nullptr : header_name.c_str();
	}

	[[gnu::pure]]
	bool IsSafeMethod(HttpMethod method) const noexcept;

	/**
	 * Add all whitespace-separated origins from the given list to
	 * #trusted_origins.
	 */
	void AddTrustedOrigins(std::string_view list);

	/**
	 * Verify the configuration.  Throws on error.
	 */
	void Check() const;
};

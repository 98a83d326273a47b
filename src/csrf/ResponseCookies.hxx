// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Request.hxx"

#include <string>
#include <utility>
#include <vector>

class StringMap;

/**
 * A #CsrfResponse implementation which collects "Set-Cookie"
 * response headers.
 */
class HttpResponseCookies final : public CsrfResponse {
	/**
	 * Pairs of cookie name and "Set-Cookie" header value.
	 */
	std::vector<std::pair<std::string, std::string>> cookies;

public:
	bool empty() const noexcept {
		return cookies.empty();
	}

	std::size_t size() const noexcept {
		return cookies.size();
	}

	/**
	 * Return the "Set-Cookie" header value for the given cookie
	 * name, or nullptr if no such cookie was set.
	 */
	[[gnu::pure]]
	const char *Get(std::string_view name) const noexcept;

	/**
	 * Add all cookies as "set-cookie" headers.
	 */
	void WriteHeaders(StringMap &headers) const;

	/* virtual methods from class CsrfResponse */
	void SetCookie(const SetCookieParameters &cookie,
		       bool overwrite) override;
};

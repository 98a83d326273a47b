// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Policy.hxx"
#include "Config.hxx"
#include "io/Logger.hxx"

/**
 * A #CsrfPolicy which stores the token in a cookie.  The cookie is
 * not "HttpOnly", because client-side scripts need to read it to
 * send the token in a request header.
 */
class CookieCsrfPolicy final : public CsrfPolicy {
	const LLogger logger;

	const CsrfCookieConfig config;

public:
	explicit CookieCsrfPolicy(const CsrfCookieConfig &_config);

	const CsrfCookieConfig &GetConfig() const noexcept {
		return config;
	}

	/* virtual methods from class CsrfPolicy */
	std::string GetToken(CsrfRequest &request) const override;
	std::string NewToken(CsrfRequest &request) const override;

private:
	/**
	 * Remember the token in the request's cookie map and schedule
	 * the "Set-Cookie" response header.
	 */
	void StoreToken(CsrfRequest &request, const std::string &token) const;
};

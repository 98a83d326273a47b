// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CookiePolicy.hxx"
#include "Request.hxx"
#include "Token.hxx"
#include "http/SetCookie.hxx"

CookieCsrfPolicy::CookieCsrfPolicy(const CsrfCookieConfig &_config)
	:logger("csrf_cookie"), config(_config) {}

std::string
CookieCsrfPolicy::GetToken(CsrfRequest &request) const
{
	/* an empty cookie is treated like a missing one */
	if (const char *token = request.cookies.Get(config.name);
	    token != nullptr && *token != 0)
		return token;

	return NewToken(request);
}

std::string
CookieCsrfPolicy::NewToken(CsrfRequest &request) const
{
	auto token = GenerateCsrfToken();
	StoreToken(request, token);
	return token;
}

void
CookieCsrfPolicy::StoreToken(CsrfRequest &request,
			     const std::string &token) const
{
	const bool secure = request.IsSecure();

	logger.Fmt(5, "scheduling new cookie {:?} for host {:?}",
		   config.name, request.host);

	/* the callback is keyed by the cookie name; a token created
	   later during this request replaces this one */
	request.AddResponseCallback(config.name,
				    [this, token, secure](CsrfResponse &response){
		SetCookieParameters p;
		p.name = config.name;
		p.value = token;
		p.domain = config.domain.empty() ? nullptr : config.domain.c_str();
		p.path = config.path.c_str();
		p.max_age = config.max_age;
		p.same_site = config.same_site;
		p.secure = secure;
		p.http_only = false;

		response.SetCookie(p, true);
	});

	request.cookies.Set(config.name, token);
}

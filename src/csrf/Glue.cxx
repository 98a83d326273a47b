// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Glue.hxx"
#include "Config.hxx"
#include "Request.hxx"
#include "Error.hxx"
#include "SessionPolicy.hxx"
#include "CookiePolicy.hxx"

std::unique_ptr<CsrfPolicy>
MakeCsrfPolicy(const CsrfConfig &config)
{
	switch (config.implementation) {
	case CsrfImplementation::SESSION:
		return std::make_unique<SessionCsrfPolicy>();

	case CsrfImplementation::COOKIE:
		return std::make_unique<CookieCsrfPolicy>(config.cookie);
	}

	throw CsrfConfigurationError("Unknown CSRF implementation");
}

static const CsrfPolicy &
GetPolicy(const CsrfRequest &request)
{
	if (request.policy == nullptr)
		throw CsrfConfigurationError("No CSRF policy configured");

	return *request.policy;
}

std::string
GetCsrfToken(CsrfRequest &request)
{
	return GetPolicy(request).GetToken(request);
}

std::string
NewCsrfToken(CsrfRequest &request)
{
	return GetPolicy(request).NewToken(request);
}

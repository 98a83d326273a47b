// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SessionPolicy.hxx"
#include "Request.hxx"
#include "Error.hxx"

static CsrfSession &
GetSession(CsrfRequest &request)
{
	if (request.session == nullptr)
		throw CsrfConfigurationError("CSRF tokens stored in the session require a session facility");

	return *request.session;
}

std::string
SessionCsrfPolicy::GetToken(CsrfRequest &request) const
{
	return GetSession(request).GetCsrfToken();
}

std::string
SessionCsrfPolicy::NewToken(CsrfRequest &request) const
{
	return GetSession(request).NewCsrfToken();
}

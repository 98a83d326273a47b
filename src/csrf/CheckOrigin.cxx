// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Check.hxx"
#include "Request.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "net/SameDomain.hxx"
#include "uri/Extract.hxx"
#include "util/StringAPI.hxx"

#include <fmt/format.h>

#include <algorithm>

static bool
Fail(bool raise, const std::string &reason)
{
	if (raise)
		throw BadCsrfOrigin(reason);

	return false;
}

bool
CheckCsrfOrigin(const CsrfRequest &request,
		const std::vector<std::string> *trusted_origins,
		bool raise)
{
	if (!request.IsSecure())
		/* a man-in-the-middle can forge everything on a plain
		   connection; only https requests are checked */
		return true;

	const char *origin = request.GetHeader("origin");
	if (origin == nullptr)
		origin = request.GetHeader("referer");

	if (origin == nullptr || *origin == 0)
		return Fail(raise, "Origin checking failed - no Origin or Referer.");

	/* an http page must not be able to submit to the https site */
	if (!StringIsEqualIgnoreCase(UriScheme(origin), "https"))
		return Fail(raise, "Referer checking failed - Referer is insecure while host is secure.");

	const auto origin_host = UriHostAndPort(origin);

	std::vector<std::string> trusted;
	if (trusted_origins != nullptr)
		trusted = *trusted_origins;
	else if (request.config != nullptr)
		trusted = request.config->trusted_origins;

	/* the request's own host is always trusted */
	trusted.emplace_back(request.GetHostAndPort());

	if (std::none_of(trusted.begin(), trusted.end(), [origin_host](const auto &i){
		return IsSameDomain(origin_host, i);
	}))
		return Fail(raise,
			    fmt::format("Referer checking failed - {} does not match any trusted origins.",
					origin));

	return true;
}

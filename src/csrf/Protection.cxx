// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Protection.hxx"
#include "Glue.hxx"
#include "Check.hxx"
#include "Request.hxx"
#include "Policy.hxx"
#include "Error.hxx"

#include <fmt/format.h>

#include <cassert>

CsrfProtection::CsrfProtection(const CsrfConfig &_config)
	:CsrfProtection(_config, MakeCsrfPolicy(_config)) {}

CsrfProtection::CsrfProtection(const CsrfConfig &_config,
			       std::unique_ptr<CsrfPolicy> _policy)
	:logger("csrf"), config(_config), policy(std::move(_policy))
{
	if (!policy)
		throw CsrfConfigurationError("No CSRF policy");

	config.Check();
}

CsrfProtection::~CsrfProtection() noexcept = default;

void
CsrfProtection::Attach(CsrfRequest &request) const noexcept
{
	request.policy = policy.get();
	request.config = &config;
}

bool
CsrfProtection::NeedsCheck(const CsrfRequest &request) const
{
	if (!config.require_csrf || config.IsSafeMethod(request.method))
		return false;

	return !predicate || predicate(request);
}

void
CsrfProtection::CheckRequest(CsrfRequest &request) const
{
	assert(request.policy == policy.get());

	if (!NeedsCheck(request))
		return;

	try {
		if (config.check_origin)
			CheckCsrfOrigin(request);

		CheckCsrfToken(request, config.GetTokenField(),
			       config.GetHeaderName());
	} catch (const CsrfCheckError &) {
		if (LoggerDetail::IsLogLevelVisible(2)) {
			const char *method = ToString(request.method);
			logger(2, fmt::format("rejected {} request to {:?}",
					      method != nullptr ? method : "?",
					      request.host),
			       std::current_exception());
		}

		throw;
	}
}

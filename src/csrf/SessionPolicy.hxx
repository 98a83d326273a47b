// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Policy.hxx"

/**
 * A #CsrfPolicy which delegates to the request's #CsrfSession.
 * Using it for a request without a session throws
 * #CsrfConfigurationError.
 */
class SessionCsrfPolicy final : public CsrfPolicy {
public:
	/* virtual methods from class CsrfPolicy */
	std::string GetToken(CsrfRequest &request) const override;
	std::string NewToken(CsrfRequest &request) const override;
};

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <memory>
#include <string>

struct CsrfRequest;
struct CsrfConfig;
class CsrfPolicy;

/**
 * Create the #CsrfPolicy selected by the configuration.
 */
std::unique_ptr<CsrfPolicy>
MakeCsrfPolicy(const CsrfConfig &config);

/**
 * Return the current token of the request, generating one if there
 * is none, using the request's active #CsrfPolicy.
 *
 * Throws #CsrfConfigurationError if there is no active policy.
 */
std::string
GetCsrfToken(CsrfRequest &request);

/**
 * Generate and persist a new token using the request's active
 * #CsrfPolicy.
 *
 * Throws #CsrfConfigurationError if there is no active policy.
 */
std::string
NewCsrfToken(CsrfRequest &request);

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

struct CsrfRequest;

/**
 * Strategy which stores and retrieves the CSRF token of a client.
 * Implementations must not have mutable state; one instance is
 * shared by all requests (and threads).
 */
class CsrfPolicy {
public:
	virtual ~CsrfPolicy() noexcept = default;

	/**
	 * Return the currently active token, generating a new one if
	 * there is none.
	 */
	virtual std::string GetToken(CsrfRequest &request) const = 0;

	/**
	 * Generate a new token and persist it, invalidating the
	 * previous one.  A following GetToken() call on the same
	 * request returns the new token.
	 */
	virtual std::string NewToken(CsrfRequest &request) const = 0;
};

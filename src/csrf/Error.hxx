// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * CSRF protection is not configured properly, e.g. there is no
 * active #CsrfPolicy or the session policy is used without a
 * session.  This is fatal and is not meant to be caught by request
 * handlers.
 */
class CsrfConfigurationError : public std::runtime_error {
public:
	explicit CsrfConfigurationError(const char *msg)
		:std::runtime_error(msg) {}

	explicit CsrfConfigurationError(const std::string &msg)
		:std::runtime_error(msg) {}
};

/**
 * Base class for exceptions thrown when a request fails a CSRF
 * check.  Request handlers usually respond with "403 Forbidden".
 */
class CsrfCheckError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The token supplied by the client is missing or does not match the
 * expected token.
 */
class BadCsrfToken final : public CsrfCheckError {
public:
	using CsrfCheckError::CsrfCheckError;
};

/**
 * The "Origin" (or "Referer") request header is missing, insecure or
 * not trusted.  The message describes which of these.
 */
class BadCsrfOrigin final : public CsrfCheckError {
public:
	using CsrfCheckError::CsrfCheckError;
};

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "io/Logger.hxx"

#include <functional>
#include <memory>

struct CsrfRequest;
class CsrfPolicy;

/**
 * The CSRF protection of an HTTP server.  It is created once at
 * startup and owns the active #CsrfPolicy; each incoming request is
 * attached to it.
 */
class CsrfProtection {
	const LLogger logger;

	const CsrfConfig config;

	const std::unique_ptr<CsrfPolicy> policy;

public:
	/**
	 * Returns false if the request shall not be checked
	 * automatically, even though its method is unsafe.
	 */
	using Predicate = std::function<bool(const CsrfRequest &request)>;

private:
	Predicate predicate;

public:
	/**
	 * Create the policy selected by the configuration.  Throws on
	 * configuration errors.
	 */
	explicit CsrfProtection(const CsrfConfig &_config);

	/**
	 * Use a custom policy instead of the one selected by the
	 * configuration.
	 */
	CsrfProtection(const CsrfConfig &_config,
		  std::unique_ptr<CsrfPolicy> _policy);

	~CsrfProtection() noexcept;

	CsrfProtection(const CsrfProtection &) = delete;
	CsrfProtection &operator=(const CsrfProtection &) = delete;

	const CsrfConfig &GetConfig() const noexcept {
		return config;
	}

	const CsrfPolicy &GetPolicy() const noexcept {
		return *policy;
	}

	void SetPredicate(Predicate &&_predicate) noexcept {
		predicate = std::move(_predicate);
	}

	/**
	 * Make the policy and the configuration available to the
	 * request.
	 */
	void Attach(CsrfRequest &request) const noexcept;

	/**
	 * Does this request need to be checked automatically?
	 */
	bool NeedsCheck(const CsrfRequest &request) const;

	/**
	 * Check the request if NeedsCheck() says so: first the origin
	 * (secure requests only), then the token.  Throws
	 * #BadCsrfOrigin or #BadCsrfToken on failure.
	 */
	void CheckRequest(CsrfRequest &request) const;
};

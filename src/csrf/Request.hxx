// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "strmap.hxx"
#include "http/Method.hxx"

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct SetCookieParameters;
struct CsrfConfig;
class CsrfPolicy;

/**
 * The session facility used by #SessionCsrfPolicy.  It is
 * implemented by the session manager of the HTTP server.
 */
class CsrfSession {
public:
	virtual ~CsrfSession() noexcept = default;

	/**
	 * Return the token stored in the session, generating (and
	 * storing) one if there is none.
	 */
	virtual std::string GetCsrfToken() = 0;

	/**
	 * Generate a new token, replace the one stored in the session
	 * and return it.
	 */
	virtual std::string NewCsrfToken() = 0;
};

/**
 * The response which is about to be sent to the client.  It is only
 * accessed by callbacks registered with
 * CsrfRequest::AddResponseCallback().
 */
class CsrfResponse {
public:
	virtual ~CsrfResponse() noexcept = default;

	/**
	 * @param overwrite if true, then a cookie with the same name
	 * which was set previously on this response is replaced
	 */
	virtual void SetCookie(const SetCookieParameters &cookie,
			       bool overwrite) = 0;
};

/**
 * The view of an incoming HTTP request needed by the CSRF checks.
 * The HTTP server fills in the request attributes; the active
 * #CsrfPolicy and the #CsrfConfig are attached by
 * CsrfProtection::Attach().
 */
struct CsrfRequest {
	using ResponseCallback = std::function<void(CsrfResponse &)>;

	/**
	 * The scheme the client used to connect, e.g. "http" or
	 * "https".
	 */
	std::string scheme = "http";

	/**
	 * The host name the client requested (without the port and
	 * without square brackets around IPv6 addresses).
	 */
	std::string host;

	/**
	 * The port the client connected to; 0 means the default port
	 * of #scheme.
	 */
	unsigned port = 0;

	HttpMethod method = HttpMethod::GET;

	/**
	 * Request headers with lower-case names.  Use AddHeader() and
	 * GetHeader() instead of accessing this directly.
	 */
	StringMap headers;

	StringMap cookies;

	/**
	 * Fields of a "application/x-www-form-urlencoded" request body.
	 * Query string parameters must never be added here.
	 */
	StringMap form;

	/**
	 * The session of this request, or nullptr if there is no
	 * session facility.
	 */
	CsrfSession *session = nullptr;

	const CsrfPolicy *policy = nullptr;

	const CsrfConfig *config = nullptr;

private:
	std::vector<std::pair<std::string, ResponseCallback>> response_callbacks;

	bool response_callbacks_invoked = false;

public:
	bool IsSecure() const noexcept {
		return scheme == "https";
	}

	/**
	 * Returns #port or the default port of #scheme.
	 */
	[[gnu::pure]]
	unsigned GetEffectivePort() const noexcept;

	/**
	 * Returns "host" or "host:port" (the latter only if the port is
	 * neither 80 nor 443).
	 */
	std::string GetHostAndPort() const;

	void AddHeader(std::string_view name, std::string_view value);

	/**
	 * Look up a request header (case-insensitive).
	 *
	 * @return the value or nullptr if the header is not present
	 */
	const char *GetHeader(std::string_view name) const;

	/**
	 * Set #host and #port from a "Host" request header value.
	 *
	 * @return false if the value is malformed
	 */
	bool ApplyHostHeader(std::string_view value);

	/**
	 * Parse a "Cookie" request header into #cookies.
	 */
	void ApplyCookieHeader(std::string_view value);

	/**
	 * Parse a "application/x-www-form-urlencoded" request body into
	 * #form.
	 */
	void ApplyFormBody(std::string_view body);

	/**
	 * Register a callback which will be invoked once the response
	 * exists (by InvokeResponseCallbacks()).  A callback registered
	 * earlier with the same key is replaced.
	 *
	 * Throws std::logic_error if InvokeResponseCallbacks() has
	 * already been called.
	 */
	void AddResponseCallback(std::string_view key,
				 ResponseCallback callback);

	std::size_t GetResponseCallbackCount() const noexcept {
		return response_callbacks.size();
	}

	/**
	 * Invoke all registered response callbacks.  This must be
	 * called exactly once by the response-building stage, before
	 * the response is sent; a second call throws
	 * std::logic_error.
	 */
	void InvokeResponseCallbacks(CsrfResponse &response);
};

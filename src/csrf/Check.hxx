// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <csrf-guard/Protocol.hxx>

#include <string>
#include <vector>

struct CsrfRequest;

/**
 * Check the token supplied by the client against the one returned by
 * the request's #CsrfPolicy.  The token is looked up in the form
 * fields of the request body first, then in the request headers.
 * The query string is never considered, because tokens in URLs leak
 * through logs and "Referer" headers.
 *
 * Throws #CsrfConfigurationError if the request has no policy.
 *
 * @param token_field the name of the form field; nullptr disables
 * the body lookup
 * @param header_name the name of the request header; nullptr
 * disables the header lookup
 * @param raise throw #BadCsrfToken on mismatch instead of returning
 * false
 * @return true if the token matches
 */
bool
CheckCsrfToken(CsrfRequest &request,
	       const char *token_field=CsrfGuard::DEFAULT_TOKEN_FIELD,
	       const char *header_name=CsrfGuard::DEFAULT_TOKEN_HEADER,
	       bool raise=true);

/**
 * Check whether the "Origin" (or "Referer") header of a secure
 * request names a trusted origin.  Requests over plain "http" are
 * not checked (and the function returns true), because a network
 * attacker could forge anything there anyway.
 *
 * @param trusted_origins additional trusted origins ("host" or
 * "host:port"); nullptr means use the list from the request's
 * #CsrfConfig (if any).  The request's own host is always trusted.
 * @param raise throw #BadCsrfOrigin on failure instead of returning
 * false
 * @return true if the origin is trusted
 */
bool
CheckCsrfOrigin(const CsrfRequest &request,
		const std::vector<std::string> *trusted_origins=nullptr,
		bool raise=true);

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Check.hxx"
#include "Glue.hxx"
#include "Request.hxx"
#include "Token.hxx"
#include "Error.hxx"

#include <string_view>

static std::string_view
GetSuppliedToken(const CsrfRequest &request,
		 const char *token_field, const char *header_name)
{
	std::string_view supplied{};

	if (token_field != nullptr)
		if (const char *value = request.form.Get(token_field))
			supplied = value;

	if (supplied.empty() && header_name != nullptr)
		if (const char *value = request.GetHeader(header_name))
			supplied = value;

	return supplied;
}

bool
CheckCsrfToken(CsrfRequest &request,
	       const char *token_field, const char *header_name,
	       bool raise)
{
	const auto supplied = GetSuppliedToken(request, token_field,
					       header_name);
	const auto expected = GetCsrfToken(request);

	if (!CsrfTokensEqual(expected, supplied)) {
		if (raise)
			throw BadCsrfToken("check_csrf_token(): Invalid token");
		return false;
	}

	return true;
}

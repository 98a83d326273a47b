// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "Error.hxx"
#include "http/Cookie.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

CsrfImplementation
ParseCsrfImplementation(std::string_view s)
{
	if (s == "session"sv)
		return CsrfImplementation::SESSION;
	else if (s == "cookie"sv)
		return CsrfImplementation::COOKIE;
	else
		throw std::invalid_argument{"Unknown CSRF implementation"};
}

bool
CsrfConfig::IsSafeMethod(HttpMethod method) const noexcept
{
	return std::find(safe_methods.begin(), safe_methods.end(),
			 method) != safe_methods.end();
}

void
CsrfConfig::AddTrustedOrigins(std::string_view list)
{
	while (true) {
		const auto begin = std::find_if_not(list.begin(), list.end(),
						    IsWhitespaceOrNull);
		const auto end = std::find_if(begin, list.end(),
					      IsWhitespaceOrNull);
		if (begin == end)
			break;

		trusted_origins.emplace_back(begin, end);
		list = list.substr(end - list.begin());
	}
}

void
CsrfConfig::Check() const
{
	if (implementation == CsrfImplementation::COOKIE &&
	    !IsValidCookieName(cookie.name))
		throw CsrfConfigurationError("Invalid CSRF cookie name");

	if (!cookie.domain.empty() && !IsValidCookieValue(cookie.domain))
		throw CsrfConfigurationError("Invalid CSRF cookie domain");

	if (!cookie.path.starts_with('/'))
		throw CsrfConfigurationError("CSRF cookie path must be absolute");

	if (cookie.max_age && cookie.max_age->count() < 0)
		throw CsrfConfigurationError("Negative CSRF cookie max_age");

	if (require_csrf && token_field.empty() && header_name.empty())
		throw CsrfConfigurationError("CSRF checks require a token field or a header");
}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Extract.hxx"
#include "util/CharUtil.hxx"
#include "util/StringSplit.hxx"

#include <algorithm>

static constexpr bool
IsValidSchemeStart(char ch) noexcept
{
	return IsAlphaASCII(ch);
}

static constexpr bool
IsValidSchemeChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '+' || ch == '.' || ch == '-';
}

[[gnu::pure]]
static bool
IsValidScheme(std::string_view p) noexcept
{
	if (p.empty() || !IsValidSchemeStart(p.front()))
		return false;

	return std::all_of(p.begin() + 1, p.end(), IsValidSchemeChar);
}

bool
UriHasScheme(std::string_view uri) noexcept
{
	const auto [scheme, rest] = Split(uri, ':');
	return rest.data() != nullptr && IsValidScheme(scheme) &&
		rest.starts_with("//");
}

std::string_view
UriScheme(std::string_view uri) noexcept
{
	if (!UriHasScheme(uri))
		return {};

	return uri.substr(0, uri.find(':'));
}

/**
 * Return the URI without the scheme and the double slash (i.e.
 * starting with the authority), or nullptr if there is no
 * authority.
 */
[[gnu::pure]]
static std::string_view
UriAfterScheme(std::string_view uri) noexcept
{
	if (uri.starts_with("//") && !uri.starts_with("///"))
		return uri.substr(2);

	if (UriHasScheme(uri))
		return uri.substr(uri.find(':') + 3);

	return {};
}

[[gnu::pure]]
static std::string_view
UriAuthority(std::string_view uri) noexcept
{
	uri = UriAfterScheme(uri);
	if (uri.data() == nullptr)
		return {};

	return uri.substr(0, uri.find_first_of("/?#"));
}

std::string_view
UriHostAndPort(std::string_view uri) noexcept
{
	auto authority = UriAuthority(uri);
	if (authority.data() == nullptr)
		return {};

	/* strip user information */
	if (const auto [userinfo, host_port] = SplitLast(authority, '@');
	    host_port.data() != nullptr)
		authority = host_port;

	return authority;
}

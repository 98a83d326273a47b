// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HostParser.hxx"
#include "util/CharUtil.hxx"
#include "util/StringSplit.hxx"

#include <algorithm>

static constexpr bool
IsValidHostnameChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '-' || ch == '.' ||
		ch == '*'; /* for wildcards */
}

static constexpr bool
IsValidIPv6Char(char ch) noexcept
{
	return IsDigitASCII(ch) ||
		(ch >= 'a' && ch <= 'f') ||
		(ch >= 'A' && ch <= 'F') ||
		ch == ':' || ch == '.' || ch == '%';
}

[[gnu::pure]]
static bool
IsValidPortString(std::string_view s) noexcept
{
	return !s.empty() && s.size() <= 5 &&
		std::all_of(s.begin(), s.end(), IsDigitASCII);
}

ExtractHostResult
ExtractHost(std::string_view src) noexcept
{
	ExtractHostResult result{{}, {}, src.data()};

	if (src.starts_with('[')) {
		/* "[hostname]:port" (IPv6?) */
		const auto [host, rest] = Split(src.substr(1), ']');
		if (rest.data() == nullptr || host.empty() ||
		    !std::all_of(host.begin(), host.end(), IsValidIPv6Char))
			/* failed to parse the host */
			return result;

		result.host = host;

		if (rest.empty()) {
			result.end = rest.data();
		} else if (rest.front() == ':' &&
			   IsValidPortString(rest.substr(1))) {
			result.port = rest.substr(1);
			result.end = rest.data() + rest.size();
		} else
			result.end = rest.data();

		return result;
	}

	if (const auto colon = src.find(':');
	    colon != src.npos && colon != src.rfind(':') &&
	    std::all_of(src.begin(), src.end(), IsValidIPv6Char)) {
		/* bare IPv6 address without brackets */
		result.host = src;
		result.end = src.data() + src.size();
		return result;
	}

	const auto [host, rest] = SplitWhile(src, IsValidHostnameChar);
	if (host.empty())
		return result;

	if (rest.starts_with(':') && IsValidPortString(rest.substr(1))) {
		result.host = host;
		result.port = rest.substr(1);
		result.end = rest.data() + rest.size();
		return result;
	}

	result.host = host;
	result.end = rest.data();
	return result;
}

unsigned
ParsePort(std::string_view s) noexcept
{
	if (!IsValidPortString(s))
		return 0;

	unsigned value = 0;
	for (char ch : s)
		value = value * 10 + unsigned(ch - '0');

	if (value > 0xffff)
		return 0;

	return value;
}

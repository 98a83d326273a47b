// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <string.h>

const char *
StripLeft(const char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;

	return p;
}

std::string_view
StripLeft(std::string_view s) noexcept
{
	std::size_t i = 0;
	while (i < s.size() && IsWhitespaceOrNull(s[i]))
		++i;

	return s.substr(i);
}

void
StripRight(char *p) noexcept
{
	std::size_t length = strlen(p);
	while (length > 0 && IsWhitespaceOrNull(p[length - 1]))
		--length;

	p[length] = 0;
}

std::string_view
StripRight(std::string_view s) noexcept
{
	std::size_t length = s.size();
	while (length > 0 && IsWhitespaceOrNull(s[length - 1]))
		--length;

	return s.substr(0, length);
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}

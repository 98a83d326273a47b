// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Unescape.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>

static constexpr int
ParseHexDigit(char ch) noexcept
{
	if (IsDigitASCII(ch))
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}

std::optional<std::string>
UriUnescape(std::string_view src, char escape_char)
{
	std::string dest;
	dest.reserve(src.size());

	while (true) {
		const auto i = src.find(escape_char);
		dest.append(src.substr(0, std::min(i, src.size())));

		if (i == src.npos)
			break;

		if (i + 2 >= src.size())
			/* escape character at the end of string */
			return std::nullopt;

		const int digit1 = ParseHexDigit(src[i + 1]);
		const int digit2 = ParseHexDigit(src[i + 2]);
		if (digit1 == -1 || digit2 == -1)
			/* invalid hex digits */
			return std::nullopt;

		const char ch = (char)((digit1 << 4) | digit2);
		if (ch == 0)
			/* no %00 hack allowed! */
			return std::nullopt;

		dest.push_back(ch);
		src = src.substr(i + 3);
	}

	return dest;
}

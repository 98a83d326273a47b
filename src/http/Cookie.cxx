// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Cookie.hxx"
#include "strmap.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>

bool
IsValidCookieName(std::string_view name) noexcept
{
	return !name.empty() &&
		std::all_of(name.begin(), name.end(), IsCookieNameChar);
}

bool
IsValidCookieValue(std::string_view value) noexcept
{
	return std::all_of(value.begin(), value.end(), IsCookieOctet);
}

static constexpr bool
IsControlChar(char ch) noexcept
{
	return (unsigned char)ch < 0x20 || ch == 0x7f;
}

/**
 * Returns the value without surrounding double quotes, or a
 * default-initialized std::string_view (data()==nullptr) if it
 * contains control characters.
 */
[[gnu::pure]]
static std::string_view
ParseCookieValue(std::string_view value) noexcept
{
	if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
		value = value.substr(1, value.size() - 2);

	if (std::any_of(value.begin(), value.end(), IsControlChar))
		return {};

	/* never return nullptr for a valid (empty) value */
	return value.data() != nullptr ? value : std::string_view{""};
}

void
ParseCookieHeader(StringMap &cookies, std::string_view header)
{
	while (!header.empty()) {
		const auto [pair, rest] = Split(header, ';');
		header = rest;

		const auto [raw_name, raw_value] = Split(pair, '=');
		if (raw_value.data() == nullptr)
			continue;

		const auto name = Strip(raw_name);
		if (!IsValidCookieName(name))
			continue;

		const auto value = ParseCookieValue(Strip(raw_value));
		if (value.data() == nullptr)
			continue;

		cookies.Add(name, value);
	}
}

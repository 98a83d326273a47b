// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SetCookie.hxx"
#include "Cookie.hxx"

#include <fmt/format.h>

#include <cassert>
#include <stdexcept>

using std::string_view_literals::operator""sv;

static constexpr struct {
	std::string_view keyword;
	CookieSameSite value;
} same_site_keywords[] = {
	{ "default"sv, CookieSameSite::DEFAULT },
	{ "strict"sv, CookieSameSite::STRICT },
	{ "lax"sv, CookieSameSite::LAX },
	{ "none"sv, CookieSameSite::NONE },
};

CookieSameSite
ParseCookieSameSite(std::string_view s)
{
	for (const auto &i : same_site_keywords)
		if (s == i.keyword)
			return i.value;

	throw std::invalid_argument{"Unknown SameSite value"};
}

std::string
FormatSetCookie(const SetCookieParameters &p)
{
	assert(!p.name.empty());

	fmt::memory_buffer b;
	auto out = std::back_inserter(b);

	if (IsValidCookieValue(p.value))
		fmt::format_to(out, "{}={}", p.name, p.value);
	else
		fmt::format_to(out, "{}=\"{}\"", p.name, p.value);

	if (p.domain != nullptr)
		fmt::format_to(out, "; Domain={}", p.domain);

	if (p.path != nullptr)
		fmt::format_to(out, "; Path={}", p.path);

	if (p.max_age)
		fmt::format_to(out, "; Max-Age={}", p.max_age->count());

	if (p.secure)
		fmt::format_to(out, "; Secure");

	if (p.http_only)
		fmt::format_to(out, "; HttpOnly");

	switch (p.same_site) {
	case CookieSameSite::DEFAULT:
		break;

	case CookieSameSite::STRICT:
		fmt::format_to(out, "; SameSite=Strict");
		break;

	case CookieSameSite::LAX:
		fmt::format_to(out, "; SameSite=Lax");
		break;

	case CookieSameSite::NONE:
		fmt::format_to(out, "; SameSite=None");
		break;
	}

	return {b.data(), b.size()};
}

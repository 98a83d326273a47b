// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ResponseCookies.hxx"
#include "http/SetCookie.hxx"
#include "strmap.hxx"

#include <algorithm>

const char *
HttpResponseCookies::Get(std::string_view name) const noexcept
{
	for (const auto &[key, value] : cookies)
		if (key == name)
			return value.c_str();

	return nullptr;
}

void
HttpResponseCookies::WriteHeaders(StringMap &headers) const
{
	for (const auto &i : cookies)
		headers.Add("set-cookie", i.second);
}

void
HttpResponseCookies::SetCookie(const SetCookieParameters &cookie,
			       bool overwrite)
{
	if (overwrite)
		std::erase_if(cookies, [&cookie](const auto &i){
			return i.first == cookie.name;
		});

	cookies.emplace_back(cookie.name, FormatSetCookie(cookie));
}

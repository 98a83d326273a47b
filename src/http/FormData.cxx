// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FormData.hxx"
#include "uri/Unescape.hxx"
#include "strmap.hxx"
#include "util/StringSplit.hxx"

#include <algorithm>
#include <string>

static std::string
PlusToSpace(std::string_view s)
{
	std::string result{s};
	std::replace(result.begin(), result.end(), '+', ' ');
	return result;
}

void
ParseFormUrlEncoded(StringMap &fields, std::string_view body)
{
	while (!body.empty()) {
		const auto [field, rest] = Split(body, '&');
		body = rest;

		const auto [escaped_name, escaped_value] = Split(field, '=');
		if (escaped_name.empty() || escaped_value.data() == nullptr)
			continue;

		const auto name = UriUnescape(PlusToSpace(escaped_name));
		const auto value = UriUnescape(PlusToSpace(escaped_value));
		if (!name || !value)
			continue;

		fields.Add(*name, *value);
	}
}

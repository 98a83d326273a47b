// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SameDomain.hxx"
#include "util/StringAPI.hxx"

bool
IsSameDomain(std::string_view host, std::string_view pattern) noexcept
{
	if (host.empty() || pattern.empty())
		return false;

	if (pattern.front() == '.')
		return StringEndsWithIgnoreCase(host, pattern) ||
			StringIsEqualIgnoreCase(host, pattern.substr(1));

	return StringIsEqualIgnoreCase(host, pattern);
}

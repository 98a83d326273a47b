// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "strmap.hxx"

#include <iterator>

void
StringMap::Add(std::string_view key, std::string_view value)
{
	map.emplace(key, value);
}

void
StringMap::Set(std::string_view key, std::string_view value)
{
	Remove(key);
	Add(key, value);
}

std::size_t
StringMap::Remove(std::string_view key) noexcept
{
	const auto [first, last] = map.equal_range(key);
	const std::size_t n = std::distance(first, last);
	map.erase(first, last);
	return n;
}

const char *
StringMap::Get(std::string_view key) const noexcept
{
	/* the first value inserted with this key */
	const auto i = map.lower_bound(key);
	if (i == map.end() || i->first != key)
		return nullptr;

	return i->second.c_str();
}

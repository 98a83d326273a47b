// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>
#include <utility>

/**
 * Split the string at the first occurrence of the given separator.
 * If the separator was not found, the second half is a
 * default-initialized std::string_view (with data()==nullptr).
 */
constexpr std::pair<std::string_view, std::string_view>
Split(std::string_view haystack, char ch) noexcept
{
	const auto i = haystack.find(ch);
	if (i == haystack.npos)
		return {haystack, {}};

	return {haystack.substr(0, i), haystack.substr(i + 1)};
}

/**
 * Like Split(), but split at the last occurrence of the separator.
 */
constexpr std::pair<std::string_view, std::string_view>
SplitLast(std::string_view haystack, char ch) noexcept
{
	const auto i = haystack.rfind(ch);
	if (i == haystack.npos)
		return {haystack, {}};

	return {haystack.substr(0, i), haystack.substr(i + 1)};
}

/**
 * Split the string at the first character which does not match the
 * given predicate.
 */
template<typename P>
constexpr std::pair<std::string_view, std::string_view>
SplitWhile(std::string_view haystack, P &&predicate) noexcept
{
	std::size_t i = 0;
	while (i < haystack.size() && predicate(haystack[i]))
		++i;

	return {haystack.substr(0, i), haystack.substr(i)};
}

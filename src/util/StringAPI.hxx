// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "CharUtil.hxx"

#include <algorithm>
#include <string_view>

#include <string.h>

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqual(const char *a, const char *b) noexcept
{
	return strcmp(a, b) == 0;
}

/**
 * Compare two strings, ignoring the case of ASCII letters.  The
 * system locale is not considered.
 */
[[gnu::pure]]
static inline bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		std::equal(a.begin(), a.end(), b.begin(), [](char x, char y){
			return ToLowerASCII(x) == ToLowerASCII(y);
		});
}

[[gnu::pure]]
static inline bool
StringEndsWithIgnoreCase(std::string_view haystack,
			 std::string_view needle) noexcept
{
	return haystack.size() >= needle.size() &&
		StringIsEqualIgnoreCase(haystack.substr(haystack.size() - needle.size()),
					needle);
}

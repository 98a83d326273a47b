// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "csrf/Token.hxx"

#include <gtest/gtest.h>

#include <algorithm>

static constexpr bool
IsUrlSafeBase64Char(char ch) noexcept
{
	return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
		(ch >= '0' && ch <= '9') || ch == '-' || ch == '_';
}

TEST(CsrfToken, Generate)
{
	const auto a = GenerateCsrfToken();
	EXPECT_EQ(a.size(), CSRF_TOKEN_LENGTH);
	EXPECT_EQ(a.size(), 43u);
	EXPECT_TRUE(std::all_of(a.begin(), a.end(), IsUrlSafeBase64Char));

	const auto b = GenerateCsrfToken();
	EXPECT_EQ(b.size(), CSRF_TOKEN_LENGTH);
	EXPECT_NE(a, b);
}

TEST(CsrfToken, Equal)
{
	EXPECT_TRUE(CsrfTokensEqual("foo", "foo"));
	EXPECT_FALSE(CsrfTokensEqual("foo", "bar"));
	EXPECT_FALSE(CsrfTokensEqual("foo", "fo"));
	EXPECT_FALSE(CsrfTokensEqual("foo", "fooo"));
	EXPECT_FALSE(CsrfTokensEqual("foo", ""));
	EXPECT_FALSE(CsrfTokensEqual("foo", "Foo"));

	const auto token = GenerateCsrfToken();
	EXPECT_TRUE(CsrfTokensEqual(token, std::string{token}));
}

TEST(CsrfToken, EmptyNeverMatches)
{
	EXPECT_FALSE(CsrfTokensEqual("", ""));
	EXPECT_FALSE(CsrfTokensEqual("", "foo"));
}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/FormData.hxx"
#include "uri/Unescape.hxx"
#include "strmap.hxx"

#include <gtest/gtest.h>

TEST(UriUnescape, Basic)
{
	EXPECT_EQ(UriUnescape("foo"), "foo");
	EXPECT_EQ(UriUnescape(""), "");
	EXPECT_EQ(UriUnescape("foo%20bar"), "foo bar");
	EXPECT_EQ(UriUnescape("%2f%2F"), "//");
	EXPECT_EQ(UriUnescape("100%25"), "100%");
}

TEST(UriUnescape, Malformed)
{
	EXPECT_FALSE(UriUnescape("%"));
	EXPECT_FALSE(UriUnescape("%2"));
	EXPECT_FALSE(UriUnescape("%zz"));
	EXPECT_FALSE(UriUnescape("a%00b"));
}

TEST(FormData, Basic)
{
	StringMap fields;
	ParseFormUrlEncoded(fields, "csrf_token=foo&name=John+Doe&x=%2Fy");
	EXPECT_STREQ(fields.Get("csrf_token"), "foo");
	EXPECT_STREQ(fields.Get("name"), "John Doe");
	EXPECT_STREQ(fields.Get("x"), "/y");
}

TEST(FormData, EmptyValue)
{
	StringMap fields;
	ParseFormUrlEncoded(fields, "csrf_token=&a=b");
	EXPECT_STREQ(fields.Get("csrf_token"), "");
	EXPECT_STREQ(fields.Get("a"), "b");
}

TEST(FormData, Malformed)
{
	StringMap fields;
	ParseFormUrlEncoded(fields, "novalue&=x&bad=%zz&&ok=1");
	EXPECT_FALSE(fields.Contains("novalue"));
	EXPECT_FALSE(fields.Contains(""));
	EXPECT_FALSE(fields.Contains("bad"));
	EXPECT_STREQ(fields.Get("ok"), "1");
}

TEST(FormData, Duplicate)
{
	StringMap fields;
	ParseFormUrlEncoded(fields, "a=1&a=2");
	EXPECT_STREQ(fields.Get("a"), "1");
}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "uri/Extract.hxx"

#include <gtest/gtest.h>

static constexpr struct UriTests {
	const char *uri;
	const char *scheme;
	const char *host_and_port;
} uri_tests[] = {
	{ "http://foo/bar", "http", "foo" },
	{ "https://foo/bar", "https", "foo" },
	{ "http://foo:8080/bar", "http", "foo:8080" },
	{ "http://foo", "http", "foo" },
	{ "http://foo/bar?a=b", "http", "foo" },
	{ "http://foo?a=b", "http", "foo" },
	{ "https://user:pw@foo:8443/", "https", "foo:8443" },
	{ "https://[::1]:8443/x", "https", "[::1]:8443" },
	{ "whatever-scheme://foo/bar?a=b", "whatever-scheme", "foo" },
	{ "//foo/bar", "", "foo" },
	{ "/bar?a=b", "", nullptr },
	{ "bar?a=b", "", nullptr },
	{ "mailto:foo@example.com", "", nullptr },
};

TEST(UriExtractTest, Scheme)
{
	for (const auto &i : uri_tests)
		EXPECT_EQ(UriScheme(i.uri), i.scheme) << i.uri;
}

TEST(UriExtractTest, HostAndPort)
{
	for (const auto &i : uri_tests) {
		const auto result = UriHostAndPort(i.uri);
		if (i.host_and_port == nullptr)
			EXPECT_EQ(result.data(), nullptr) << i.uri;
		else
			EXPECT_EQ(result, i.host_and_port) << i.uri;
	}
}

TEST(UriExtractTest, HasScheme)
{
	EXPECT_TRUE(UriHasScheme("https://example.com"));
	EXPECT_FALSE(UriHasScheme("//example.com"));
	EXPECT_FALSE(UriHasScheme("1http://example.com"));
	EXPECT_FALSE(UriHasScheme("http:example.com"));
	EXPECT_FALSE(UriHasScheme(""));
}

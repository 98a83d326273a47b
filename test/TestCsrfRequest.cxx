// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "csrf/CookiePolicy.hxx"
#include "csrf/RenderGlobal.hxx"
#include "csrf/Request.hxx"
#include "csrf/ResponseCookies.hxx"
#include "csrf/Token.hxx"
#include "http/SetCookie.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(CsrfRequest, HostAndPort)
{
	CsrfRequest request;
	request.host = "example.com";
	EXPECT_EQ(request.GetEffectivePort(), 80u);
	EXPECT_EQ(request.GetHostAndPort(), "example.com");

	request.scheme = "https";
	EXPECT_EQ(request.GetEffectivePort(), 443u);
	EXPECT_EQ(request.GetHostAndPort(), "example.com");

	request.port = 8080;
	EXPECT_EQ(request.GetHostAndPort(), "example.com:8080");

	request.port = 80;
	EXPECT_EQ(request.GetHostAndPort(), "example.com");

	request.host = "::1";
	EXPECT_EQ(request.GetHostAndPort(), "[::1]");

	request.port = 8443;
	EXPECT_EQ(request.GetHostAndPort(), "[::1]:8443");
}

TEST(CsrfRequest, ApplyHostHeader)
{
	CsrfRequest request;

	EXPECT_TRUE(request.ApplyHostHeader("Example.COM"));
	EXPECT_EQ(request.host, "example.com");
	EXPECT_EQ(request.port, 0u);

	EXPECT_TRUE(request.ApplyHostHeader("example.com:8080"));
	EXPECT_EQ(request.host, "example.com");
	EXPECT_EQ(request.port, 8080u);

	EXPECT_TRUE(request.ApplyHostHeader("[::1]:8443"));
	EXPECT_EQ(request.host, "::1");
	EXPECT_EQ(request.port, 8443u);

	EXPECT_FALSE(request.ApplyHostHeader("example.com:99999"));
	EXPECT_FALSE(request.ApplyHostHeader("example.com/foo"));
	EXPECT_FALSE(request.ApplyHostHeader(""));

	/* unchanged after failures */
	EXPECT_EQ(request.host, "::1");
	EXPECT_EQ(request.port, 8443u);
}

TEST(CsrfRequest, Headers)
{
	CsrfRequest request;
	request.AddHeader("Origin", "https://example.com");
	EXPECT_STREQ(request.GetHeader("origin"), "https://example.com");
	EXPECT_STREQ(request.GetHeader("ORIGIN"), "https://example.com");
	EXPECT_EQ(request.GetHeader("Referer"), nullptr);
}

TEST(CsrfRequest, ResponseCallbacks)
{
	CsrfRequest request;

	unsigned a = 0, b = 0, c = 0;
	request.AddResponseCallback("a", [&a](CsrfResponse &){ ++a; });
	request.AddResponseCallback("b", [&b](CsrfResponse &){ ++b; });

	/* replaces the first one */
	request.AddResponseCallback("a", [&c](CsrfResponse &){ ++c; });

	EXPECT_EQ(request.GetResponseCallbackCount(), 2u);

	HttpResponseCookies response;
	request.InvokeResponseCallbacks(response);

	EXPECT_EQ(a, 0u);
	EXPECT_EQ(b, 1u);
	EXPECT_EQ(c, 1u);
	EXPECT_EQ(request.GetResponseCallbackCount(), 0u);
}

TEST(CsrfRequest, ResponseCallbacksOnce)
{
	CsrfRequest request;

	unsigned n = 0;
	request.AddResponseCallback("a", [&n](CsrfResponse &){ ++n; });

	HttpResponseCookies response;
	request.InvokeResponseCallbacks(response);
	EXPECT_EQ(n, 1u);

	EXPECT_THROW(request.InvokeResponseCallbacks(response),
		     std::logic_error);
	EXPECT_EQ(n, 1u);

	/* too late: the response has already been built */
	EXPECT_THROW(request.AddResponseCallback("b", [](CsrfResponse &){}),
		     std::logic_error);
	EXPECT_EQ(request.GetResponseCallbackCount(), 0u);
}

TEST(CsrfRequest, NewCookieTokenAfterResponse)
{
	const CookieCsrfPolicy policy{CsrfCookieConfig{}};

	CsrfRequest request;
	request.ApplyCookieHeader("csrf_token=e6f325fee5974f3da4315a8ccf4513d2");

	HttpResponseCookies response;
	request.InvokeResponseCallbacks(response);

	EXPECT_THROW(policy.NewToken(request), std::logic_error);
	EXPECT_STREQ(request.cookies.Get("csrf_token"),
		     "e6f325fee5974f3da4315a8ccf4513d2");
	EXPECT_TRUE(response.empty());
}

TEST(CsrfRequest, AllocatingFunctionsMayThrow)
{
	/* std::bad_alloc must reach the caller instead of terminating */
	CsrfRequest request;
	StringMap map;
	RenderGlobals globals;
	static_assert(!noexcept(map.Add("a", "b")));
	static_assert(!noexcept(map.Set("a", "b")));
	static_assert(!noexcept(request.AddHeader("a", "b")));
	static_assert(!noexcept(request.ApplyCookieHeader("a=b")));
	static_assert(!noexcept(request.ApplyFormBody("a=b")));
	static_assert(!noexcept(request.AddResponseCallback("a", {})));
	static_assert(!noexcept(InjectCsrfTokenGlobal(globals, request)));
	static_assert(!noexcept(GenerateCsrfToken()));

	EXPECT_FALSE(InjectCsrfTokenGlobal(globals, request));
}

TEST(HttpResponseCookies, Overwrite)
{
	HttpResponseCookies response;
	EXPECT_TRUE(response.empty());

	SetCookieParameters p;
	p.name = "a";
	p.value = "1";
	p.path = nullptr;
	p.http_only = false;
	response.SetCookie(p, false);

	p.name = "b";
	p.value = "2";
	response.SetCookie(p, false);

	p.name = "a";
	p.value = "3";
	response.SetCookie(p, true);

	EXPECT_EQ(response.size(), 2u);
	EXPECT_STREQ(response.Get("a"), "a=3");
	EXPECT_STREQ(response.Get("b"), "b=2");
	EXPECT_EQ(response.Get("c"), nullptr);

	p.value = "4";
	response.SetCookie(p, false);
	EXPECT_EQ(response.size(), 3u);

	StringMap headers;
	response.WriteHeaders(headers);
	EXPECT_STREQ(headers.Get("set-cookie"), "b=2");
}

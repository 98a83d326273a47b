// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "csrf/Protection.hxx"
#include "csrf/Glue.hxx"
#include "csrf/Policy.hxx"
#include "csrf/CookiePolicy.hxx"
#include "csrf/SessionPolicy.hxx"
#include "csrf/RenderGlobal.hxx"
#include "csrf/Request.hxx"
#include "csrf/ResponseCookies.hxx"
#include "csrf/Error.hxx"
#include "io/Logger.hxx"

#include <csrf-guard/Protocol.hxx>

#include <gtest/gtest.h>

namespace {

class FixedCsrfPolicy final : public CsrfPolicy {
public:
	/* virtual methods from class CsrfPolicy */
	std::string GetToken(CsrfRequest &) const override {
		return "02821185e4c94269bdc38e6eeae0a2f8";
	}

	std::string NewToken(CsrfRequest &) const override {
		return "02821185e4c94269bdc38e6eeae0a2f8";
	}
};

CsrfConfig
MakeRequireConfig()
{
	CsrfConfig config;
	config.require_csrf = true;
	return config;
}

}

TEST(CsrfProtection, MakePolicy)
{
	CsrfConfig config;
	EXPECT_NE(dynamic_cast<SessionCsrfPolicy *>(MakeCsrfPolicy(config).get()),
		  nullptr);

	config.implementation = CsrfImplementation::COOKIE;
	EXPECT_NE(dynamic_cast<CookieCsrfPolicy *>(MakeCsrfPolicy(config).get()),
		  nullptr);
}

TEST(CsrfProtection, NullPolicy)
{
	EXPECT_THROW(CsrfProtection(CsrfConfig{}, nullptr), CsrfConfigurationError);
}

TEST(CsrfProtection, InvalidConfig)
{
	CsrfConfig config;
	config.implementation = CsrfImplementation::COOKIE;
	config.cookie.name = "bad name";
	EXPECT_THROW(CsrfProtection{config}, CsrfConfigurationError);
}

TEST(CsrfProtection, Attach)
{
	const CsrfProtection guard{CsrfConfig{}, std::make_unique<FixedCsrfPolicy>()};

	CsrfRequest request;
	guard.Attach(request);
	EXPECT_EQ(request.policy, &guard.GetPolicy());
	EXPECT_EQ(request.config, &guard.GetConfig());

	EXPECT_EQ(GetCsrfToken(request), "02821185e4c94269bdc38e6eeae0a2f8");
	EXPECT_EQ(NewCsrfToken(request), "02821185e4c94269bdc38e6eeae0a2f8");
}

TEST(CsrfProtection, NotRequired)
{
	const CsrfProtection guard{CsrfConfig{}, std::make_unique<FixedCsrfPolicy>()};

	CsrfRequest request;
	request.method = HttpMethod::POST;
	guard.Attach(request);

	EXPECT_FALSE(guard.NeedsCheck(request));
	EXPECT_NO_THROW(guard.CheckRequest(request));
}

TEST(CsrfProtection, SafeMethods)
{
	const CsrfProtection guard{MakeRequireConfig(),
			      std::make_unique<FixedCsrfPolicy>()};

	CsrfRequest request;
	guard.Attach(request);

	for (auto method : {HttpMethod::GET, HttpMethod::HEAD,
			    HttpMethod::OPTIONS, HttpMethod::TRACE}) {
		request.method = method;
		EXPECT_FALSE(guard.NeedsCheck(request));
		EXPECT_NO_THROW(guard.CheckRequest(request));
	}

	for (auto method : {HttpMethod::POST, HttpMethod::PUT,
			    HttpMethod::DELETE, HttpMethod::PATCH}) {
		request.method = method;
		EXPECT_TRUE(guard.NeedsCheck(request));
		EXPECT_THROW(guard.CheckRequest(request), BadCsrfToken);
	}
}

TEST(CsrfProtection, CustomSafeMethods)
{
	auto config = MakeRequireConfig();
	config.safe_methods = {HttpMethod::GET};

	const CsrfProtection guard{config, std::make_unique<FixedCsrfPolicy>()};

	CsrfRequest request;
	guard.Attach(request);

	request.method = HttpMethod::GET;
	EXPECT_FALSE(guard.NeedsCheck(request));

	request.method = HttpMethod::HEAD;
	EXPECT_TRUE(guard.NeedsCheck(request));
}

TEST(CsrfProtection, ValidToken)
{
	const CsrfProtection guard{MakeRequireConfig(),
			      std::make_unique<FixedCsrfPolicy>()};

	CsrfRequest request;
	request.method = HttpMethod::POST;
	guard.Attach(request);
	request.ApplyFormBody("csrf_token=02821185e4c94269bdc38e6eeae0a2f8");

	EXPECT_NO_THROW(guard.CheckRequest(request));
}

TEST(CsrfProtection, LogRejection)
{
	const CsrfProtection guard{MakeRequireConfig(),
			      std::make_unique<FixedCsrfPolicy>()};

	CsrfRequest request;
	request.method = HttpMethod::POST;
	request.host = "example.com";
	guard.Attach(request);
	request.ApplyFormBody("csrf_token=wrong");

	SetLogLevel(2);
	testing::internal::CaptureStderr();
	EXPECT_THROW(guard.CheckRequest(request), BadCsrfToken);
	const auto output = testing::internal::GetCapturedStderr();
	SetLogLevel(1);

	EXPECT_NE(output.find("[csrf] rejected POST request to \"example.com\": "),
		  output.npos) << output;
	EXPECT_NE(output.find("Invalid token"), output.npos) << output;
}

TEST(CsrfProtection, ConfiguredNames)
{
	auto config = MakeRequireConfig();
	config.token_field.clear();
	config.header_name = "X-XSRF-Token";

	const CsrfProtection guard{config, std::make_unique<FixedCsrfPolicy>()};

	CsrfRequest request;
	request.method = HttpMethod::POST;
	guard.Attach(request);

	request.ApplyFormBody("csrf_token=02821185e4c94269bdc38e6eeae0a2f8");
	EXPECT_THROW(guard.CheckRequest(request), BadCsrfToken);

	request.AddHeader("X-XSRF-Token", "02821185e4c94269bdc38e6eeae0a2f8");
	EXPECT_NO_THROW(guard.CheckRequest(request));
}

TEST(CsrfProtection, OriginCheckedFirst)
{
	const CsrfProtection guard{MakeRequireConfig(),
			      std::make_unique<FixedCsrfPolicy>()};

	CsrfRequest request;
	request.scheme = "https";
	request.host = "example.com";
	request.method = HttpMethod::POST;
	guard.Attach(request);
	request.ApplyFormBody("csrf_token=02821185e4c94269bdc38e6eeae0a2f8");

	EXPECT_THROW(guard.CheckRequest(request), BadCsrfOrigin);

	request.AddHeader("Origin", "https://evil.example.org");
	EXPECT_THROW(guard.CheckRequest(request), BadCsrfOrigin);

	request.headers.clear();
	request.AddHeader("Origin", "https://example.com");
	EXPECT_NO_THROW(guard.CheckRequest(request));
}

TEST(CsrfProtection, OriginCheckDisabled)
{
	auto config = MakeRequireConfig();
	config.check_origin = false;

	const CsrfProtection guard{config, std::make_unique<FixedCsrfPolicy>()};

	CsrfRequest request;
	request.scheme = "https";
	request.host = "example.com";
	request.method = HttpMethod::POST;
	guard.Attach(request);
	request.ApplyFormBody("csrf_token=02821185e4c94269bdc38e6eeae0a2f8");

	EXPECT_NO_THROW(guard.CheckRequest(request));
}

TEST(CsrfProtection, TrustedOriginFromConfig)
{
	auto config = MakeRequireConfig();
	config.trusted_origins.emplace_back(".example.org");

	const CsrfProtection guard{config, std::make_unique<FixedCsrfPolicy>()};

	CsrfRequest request;
	request.scheme = "https";
	request.host = "example.com";
	request.method = HttpMethod::POST;
	guard.Attach(request);
	request.ApplyFormBody("csrf_token=02821185e4c94269bdc38e6eeae0a2f8");
	request.AddHeader("Referer", "https://www.example.org/form");

	EXPECT_NO_THROW(guard.CheckRequest(request));
}

TEST(CsrfProtection, Predicate)
{
	CsrfProtection guard{MakeRequireConfig(), std::make_unique<FixedCsrfPolicy>()};
	guard.SetPredicate([](const CsrfRequest &request){
		return request.host != "api.example.com";
	});

	CsrfRequest request;
	request.method = HttpMethod::POST;
	guard.Attach(request);

	request.host = "api.example.com";
	EXPECT_FALSE(guard.NeedsCheck(request));
	EXPECT_NO_THROW(guard.CheckRequest(request));

	request.host = "www.example.com";
	EXPECT_TRUE(guard.NeedsCheck(request));
	EXPECT_THROW(guard.CheckRequest(request), BadCsrfToken);
}

TEST(CsrfProtection, StatefulPredicate)
{
	CsrfProtection guard{MakeRequireConfig(), std::make_unique<FixedCsrfPolicy>()};

	/* exempts only the first request */
	unsigned calls = 0;
	guard.SetPredicate([&calls](const CsrfRequest &){
		return ++calls > 1;
	});

	CsrfRequest request;
	request.method = HttpMethod::POST;
	guard.Attach(request);

	const bool first = guard.NeedsCheck(request);
	const bool second = guard.NeedsCheck(request);
	EXPECT_FALSE(first);
	EXPECT_TRUE(second);
	EXPECT_EQ(calls, 2u);
}

TEST(CsrfProtection, CookieRoundTrip)
{
	auto config = MakeRequireConfig();
	config.implementation = CsrfImplementation::COOKIE;

	const CsrfProtection guard{config};

	/* first request: render a form */
	CsrfRequest request1;
	guard.Attach(request1);

	RenderGlobals globals;
	ASSERT_TRUE(InjectCsrfTokenGlobal(globals, request1));
	const auto i = globals.find(CsrfGuard::RENDER_GLOBAL_NAME);
	ASSERT_NE(i, globals.end());

	const auto token = i->second();
	EXPECT_EQ(i->second(), token);

	HttpResponseCookies response;
	request1.InvokeResponseCallbacks(response);
	ASSERT_EQ(response.size(), 1u);
	EXPECT_EQ(std::string{response.Get("csrf_token")},
		  "csrf_token=" + token + "; Path=/");

	/* second request: submit the form */
	CsrfRequest request2;
	request2.method = HttpMethod::POST;
	guard.Attach(request2);
	request2.ApplyCookieHeader("csrf_token=" + token);
	request2.ApplyFormBody("csrf_token=" + token);

	EXPECT_NO_THROW(guard.CheckRequest(request2));
	EXPECT_EQ(request2.GetResponseCallbackCount(), 0u);

	/* forged submission */
	CsrfRequest request3;
	request3.method = HttpMethod::POST;
	guard.Attach(request3);
	request3.ApplyFormBody("csrf_token=" + token);

	EXPECT_THROW(guard.CheckRequest(request3), BadCsrfToken);
}

TEST(RenderGlobal, NoPolicy)
{
	CsrfRequest request;

	RenderGlobals globals;
	EXPECT_FALSE(InjectCsrfTokenGlobal(globals, request));
	EXPECT_TRUE(globals.empty());
}

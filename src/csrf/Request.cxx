// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Request.hxx"
#include "http/Cookie.hxx"
#include "http/FormData.hxx"
#include "net/HostParser.hxx"
#include "util/CharUtil.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

static std::string
LowerCase(std::string_view s)
{
	std::string result;
	result.reserve(s.size());
	std::transform(s.begin(), s.end(), std::back_inserter(result),
		       [](char ch){ return ToLowerASCII(ch); });
	return result;
}

unsigned
CsrfRequest::GetEffectivePort() const noexcept
{
	if (port != 0)
		return port;

	return IsSecure() ? 443 : 80;
}

std::string
CsrfRequest::GetHostAndPort() const
{
	const bool is_ipv6 = host.find(':') != host.npos;
	const unsigned effective_port = GetEffectivePort();

	if (effective_port == 80 || effective_port == 443)
		return is_ipv6 ? fmt::format("[{}]", host) : host;

	return is_ipv6
		? fmt::format("[{}]:{}", host, effective_port)
		: fmt::format("{}:{}", host, effective_port);
}

void
CsrfRequest::AddHeader(std::string_view name, std::string_view value)
{
	headers.Add(LowerCase(name), value);
}

const char *
CsrfRequest::GetHeader(std::string_view name) const
{
	return headers.Get(LowerCase(name));
}

bool
CsrfRequest::ApplyHostHeader(std::string_view value)
{
	const auto eh = ExtractHost(value);
	if (eh.HasFailed() || eh.end != value.data() + value.size())
		return false;

	unsigned new_port = 0;
	if (!eh.port.empty()) {
		new_port = ParsePort(eh.port);
		if (new_port == 0)
			return false;
	}

	host = LowerCase(eh.host);
	port = new_port;
	return true;
}

void
CsrfRequest::ApplyCookieHeader(std::string_view value)
{
	ParseCookieHeader(cookies, value);
}

void
CsrfRequest::ApplyFormBody(std::string_view body)
{
	ParseFormUrlEncoded(form, body);
}

void
CsrfRequest::AddResponseCallback(std::string_view key,
				 ResponseCallback callback)
{
	if (response_callbacks_invoked)
		throw std::logic_error{"Response callbacks have already been invoked"};

	auto i = std::find_if(response_callbacks.begin(), response_callbacks.end(),
			      [key](const auto &c){ return c.first == key; });
	if (i != response_callbacks.end())
		i->second = std::move(callback);
	else
		response_callbacks.emplace_back(key, std::move(callback));
}

void
CsrfRequest::InvokeResponseCallbacks(CsrfResponse &response)
{
	if (response_callbacks_invoked)
		throw std::logic_error{"Response callbacks have already been invoked"};

	response_callbacks_invoked = true;

	const auto callbacks = std::move(response_callbacks);
	response_callbacks.clear();

	for (const auto &[key, callback] : callbacks)
		callback(response);
}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

enum class HttpMethod : uint_least8_t {
	UNDEFINED,
	HEAD,
	GET,
	POST,
	PUT,
	DELETE,
	OPTIONS,
	TRACE,
	PATCH,
	CONNECT,
};

/**
 * Parse a method name (case-sensitive, as specified by RFC 7230).
 *
 * @return the method or HttpMethod::UNDEFINED if the name is not
 * known
 */
[[gnu::pure]]
HttpMethod
ParseHttpMethod(std::string_view s) noexcept;

[[gnu::const]]
const char *
ToString(HttpMethod method) noexcept;

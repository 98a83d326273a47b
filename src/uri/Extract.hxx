// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/**
 * Does this URI have a scheme followed by "://"?
 */
[[gnu::pure]]
bool
UriHasScheme(std::string_view uri) noexcept;

/**
 * Return the scheme of an absolute URI (without the colon), or an
 * empty string if there is none.
 */
[[gnu::pure]]
std::string_view
UriScheme(std::string_view uri) noexcept;

/**
 * Return the "host[:port]" part of an absolute URI.  User
 * information ("user:password@") is not part of the result.
 *
 * @return the host and port or a default-initialized
 * std::string_view (data()==nullptr) if the URI has no authority
 */
[[gnu::pure]]
std::string_view
UriHostAndPort(std::string_view uri) noexcept;

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

struct ExtractHostResult {
	/**
	 * The host part of the address (without square brackets).
	 *
	 * If nothing was parsed, then this is nullptr.
	 */
	std::string_view host;

	/**
	 * The port number string (without the colon); empty if none was
	 * specified.
	 */
	std::string_view port;

	/**
	 * Pointer to the first character that was not parsed.  On
	 * success, this is the end of the input string.
	 */
	const char *end;

	bool HasFailed() const noexcept {
		return host.data() == nullptr;
	}
};

/**
 * Extract the host and port from a string in the form "host",
 * "host:port", "[ipv6]" or "[ipv6]:port".  A bare IPv6 address
 * without brackets is returned as host without a port.
 */
[[gnu::pure]]
ExtractHostResult
ExtractHost(std::string_view src) noexcept;

/**
 * Parse a port number string.
 *
 * @return the port or 0 on error
 */
[[gnu::pure]]
unsigned
ParsePort(std::string_view s) noexcept;

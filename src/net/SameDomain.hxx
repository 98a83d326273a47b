// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/**
 * Does the given "host[:port]" match the pattern?  The comparison
 * ignores case.  A pattern beginning with a dot (".example.com")
 * matches the domain itself and all of its subdomains; any other
 * pattern must match exactly.  Substrings and suffixes without the
 * leading dot never match.
 */
[[gnu::pure]]
bool
IsSameDomain(std::string_view host, std::string_view pattern) noexcept;

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string_view>

namespace LoggerDetail {

/**
 * Messages with a level above this value are discarded.  The default
 * is 1 (errors and important warnings).
 */
extern unsigned max_level;

[[gnu::const]]
static inline bool
IsLogLevelVisible(unsigned level) noexcept
{
	return level <= max_level;
}

void
WriteV(std::string_view domain, std::string_view msg) noexcept;

void
VFmt(unsigned level, std::string_view domain,
     fmt::string_view format_str, fmt::format_args args) noexcept;

} // namespace LoggerDetail

/**
 * Set the global verbosity: messages with a level above this value
 * are suppressed.
 */
static inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

/**
 * A logger with a fixed domain name which is prepended to each
 * message (in square brackets).
 */
class LLogger {
	std::string_view domain;

public:
	explicit constexpr LLogger(std::string_view _domain) noexcept
		:domain(_domain) {}

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		if (LoggerDetail::IsLogLevelVisible(level))
			LoggerDetail::VFmt(level, domain, format_str,
					   fmt::make_format_args(args...));
	}

	/**
	 * Log an exception with all of its nested exceptions.
	 */
	void operator()(unsigned level, std::string_view prefix,
			std::exception_ptr ep) const noexcept;
};

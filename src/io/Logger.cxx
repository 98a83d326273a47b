// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <stdio.h>

namespace LoggerDetail {

unsigned max_level = 1;

void
WriteV(std::string_view domain, std::string_view msg) noexcept
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", msg);
	else
		fmt::print(stderr, "[{}] {}\n", domain, msg);
}

void
VFmt(unsigned level, std::string_view domain,
     fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!IsLogLevelVisible(level))
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	WriteV(domain, {buffer.data(), buffer.size()});
}

} // namespace LoggerDetail

void
LLogger::operator()(unsigned level, std::string_view prefix,
		    std::exception_ptr ep) const noexcept
{
	if (LoggerDetail::IsLogLevelVisible(level))
		Fmt(level, "{}: {}", prefix, GetFullMessage(ep));
}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RuntimeError.hxx"

#include <fmt/format.h>

std::runtime_error
VFmtRuntimeError(fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	return std::runtime_error{std::string{buffer.data(), buffer.size()}};
}

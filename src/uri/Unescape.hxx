// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * Unescape "%xx" sequences in the given string.
 *
 * @return the unescaped string or std::nullopt if there is a
 * malformed escape sequence or an escaped null byte
 */
std::optional<std::string>
UriUnescape(std::string_view src, char escape_char='%');

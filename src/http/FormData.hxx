// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

class StringMap;

/**
 * Parse a request body of type
 * "application/x-www-form-urlencoded" and add all fields to the
 * given map.  Malformed fields (bad escape sequences, missing '=')
 * are skipped.
 */
void
ParseFormUrlEncoded(StringMap &fields, std::string_view body);

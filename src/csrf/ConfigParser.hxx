// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/config/ConfigParser.hxx"

struct CsrfConfig;

/**
 * Parses the contents of a "csrf { ... }" block.
 */
class CsrfConfigParser final : public ConfigParser {
	CsrfConfig &config;

	/**
	 * Has a "safe_method" line been seen?  The first one replaces
	 * the default list.
	 */
	bool have_safe_methods = false;

public:
	explicit CsrfConfigParser(CsrfConfig &_config) noexcept
		:config(_config) {}

protected:
	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

/**
 * Load and parse the specified configuration file.  Throws an
 * exception on error.
 */
void
LoadCsrfConfigFile(CsrfConfig &config, const char *path);

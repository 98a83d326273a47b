// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LineParser.hxx"

#include <boost/filesystem/path.hpp>

class FileLineParser : public LineParser {
	const boost::filesystem::path &base_path;

public:
	FileLineParser(const boost::filesystem::path &_base_path,
		       char *_p) noexcept
		:LineParser(_p), base_path(_base_path) {}

	const boost::filesystem::path &GetBasePath() const noexcept {
		return base_path;
	}

	boost::filesystem::path ExpectPath();
	boost::filesystem::path ExpectPathAndEnd();
};

/**
 * Resolve a (possibly relative) path against the directory of the
 * given configuration file.
 */
boost::filesystem::path
ApplyConfigPath(const boost::filesystem::path &base,
		boost::filesystem::path &&p) noexcept;

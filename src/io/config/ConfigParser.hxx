// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem/path.hpp>

#include <map>
#include <memory>
#include <string>

class FileLineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	virtual bool PreParseLine(FileLineParser &line);
	virtual void ParseLine(FileLineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which can dynamically forward method calls to a
 * nested #ConfigParser instance.
 */
class NestedConfigParser : public ConfigParser {
	std::unique_ptr<ConfigParser> child;

public:
	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) final;
	void Finish() override;

protected:
	void SetChild(std::unique_ptr<ConfigParser> &&_child) noexcept;
	virtual void ParseLine2(FileLineParser &line) = 0;

	/**
	 * Called after the child's Finish() method, right before it
	 * is destroyed.
	 */
	virtual void FinishChild(std::unique_ptr<ConfigParser> &&) {}
};

/**
 * A #ConfigParser which ignores lines starting with '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

/**
 * A #ConfigParser which can define and use variables.
 */
class VariableConfigParser final : public ConfigParser {
	ConfigParser &child;

	std::map<std::string, std::string, std::less<>> variables;

	mutable std::string buffer;

public:
	explicit VariableConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;

private:
	void ExpandOne(std::string &dest,
		       const char *&src, const char *end) const;
	void ExpandQuoted(std::string &dest,
			  const char *src, const char *end) const;
	void Expand(std::string &dest, const char *src) const;
	char *Expand(const char *src) const;
	void Expand(FileLineParser &line) const;
};

/**
 * A #ConfigParser which can "include" other files.
 */
class IncludeConfigParser final : public ConfigParser {
	const boost::filesystem::path path;

	ConfigParser &child;

public:
	IncludeConfigParser(boost::filesystem::path &&_path,
			    ConfigParser &_child) noexcept
		:path(std::move(_path)), child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;

private:
	void IncludePath(boost::filesystem::path &&p);
	void IncludeOptionalPath(boost::filesystem::path &&p);
};

/**
 * Parse the specified configuration file, feeding each line into the
 * given #ConfigParser.  Throws on error; the exception is nested
 * inside one which describes the file name and line number.
 */
void
ParseConfigFile(const boost::filesystem::path &path, ConfigParser &parser);

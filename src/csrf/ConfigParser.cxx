// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "Config.hxx"
#include "io/config/FileLineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringAPI.hxx"

#include <chrono>

void
CsrfConfigParser::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "implementation")) {
		config.implementation = ParseCsrfImplementation(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "cookie_name")) {
		config.cookie.name = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "cookie_domain")) {
		config.cookie.domain = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "cookie_path")) {
		config.cookie.path = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "cookie_same_site")) {
		config.cookie.same_site = ParseCookieSameSite(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "cookie_max_age")) {
		config.cookie.max_age = std::chrono::seconds(line.NextPositiveInteger());
		line.ExpectEnd();
	} else if (StringIsEqual(word, "token_field")) {
		const char *value = line.ExpectValueAndEnd();
		config.token_field = StringIsEqual(value, "none") ? "" : value;
	} else if (StringIsEqual(word, "header")) {
		const char *value = line.ExpectValueAndEnd();
		config.header_name = StringIsEqual(value, "none") ? "" : value;
	} else if (StringIsEqual(word, "require_csrf")) {
		config.require_csrf = line.NextBool();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "check_origin")) {
		config.check_origin = line.NextBool();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "safe_method")) {
		const char *value = line.ExpectValueAndEnd();
		const auto method = ParseHttpMethod(value);
		if (method == HttpMethod::UNDEFINED)
			throw FmtRuntimeError("Unknown HTTP method: {}", value);

		if (!have_safe_methods) {
			config.safe_methods.clear();
			have_safe_methods = true;
		}

		config.safe_methods.push_back(method);
	} else if (StringIsEqual(word, "trusted_origin")) {
		config.trusted_origins.emplace_back(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "trusted_origins")) {
		config.AddTrustedOrigins(line.ExpectValueAndEnd());
	} else
		throw LineParser::Error("Unknown option");
}

void
CsrfConfigParser::Finish()
{
	config.Check();

	ConfigParser::Finish();
}

class CsrfTopConfigParser final : public NestedConfigParser {
	CsrfConfig &config;

	bool have_csrf = false;

public:
	explicit CsrfTopConfigParser(CsrfConfig &_config) noexcept
		:config(_config) {}

protected:
	/* virtual methods from class NestedConfigParser */
	void ParseLine2(FileLineParser &line) override;
};

void
CsrfTopConfigParser::ParseLine2(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "csrf")) {
		line.ExpectSymbolAndEol('{');

		if (have_csrf)
			throw LineParser::Error("Duplicate 'csrf' block");

		have_csrf = true;
		SetChild(std::make_unique<CsrfConfigParser>(config));
	} else
		throw LineParser::Error("Unknown option");
}

void
LoadCsrfConfigFile(CsrfConfig &config, const char *path)
{
	CsrfTopConfigParser parser(config);
	VariableConfigParser v_parser(parser);
	CommentConfigParser parser2(v_parser);
	IncludeConfigParser parser3(path, parser2);

	ParseConfigFile(path, parser3);
}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigFile.hxx"
#include "io/FileLineParser.hxx"
#include "pcre/Regex.hxx"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

class WebCacheConfigParser::Rule final : public ConfigParser {
	WebCacheConfigParser &parent;
	WebCacheRuleConfig config;

public:
	Rule(WebCacheConfigParser &_parent, const char *pattern)
		:parent(_parent)
	{
		config.pattern = pattern;
	}

protected:
	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

/**
 * The largest accepted "max_age" (about 100 years); larger values are
 * most likely typos.
 */
static constexpr std::chrono::milliseconds max_max_age =
	std::chrono::hours(24 * 365 * 100);

static std::chrono::milliseconds
ParseMilliseconds(FileLineParser &line)
{
	const char *s = line.ExpectValueAndEnd();

	/* strtoull() would accept a sign and wrap negative values */
	if (*s < '0' || *s > '9')
		throw LineParser::Error("Number of milliseconds expected");

	char *endptr;
	errno = 0;
	const unsigned long long value = strtoull(s, &endptr, 10);
	if (*endptr != 0)
		throw LineParser::Error("Number of milliseconds expected");

	if (errno == ERANGE ||
	    value > static_cast<unsigned long long>(max_max_age.count()))
		throw LineParser::Error("Number of milliseconds too large");

	return std::chrono::milliseconds(value);
}

static bool
ParseBool(FileLineParser &line)
{
	const bool value = line.NextBool();
	line.ExpectEnd();
	return value;
}

void
WebCacheConfigParser::Rule::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "max_age") == 0)
		config.max_age = ParseMilliseconds(line);
	else if (strcmp(word, "ignore_querystring") == 0)
		config.ignore_querystring = ParseBool(line);
	else if (strcmp(word, "client_cache") == 0)
		config.client_cache = ParseBool(line);
	else
		throw LineParser::Error("Unknown option");
}

void
WebCacheConfigParser::Rule::Finish()
{
	/* compile once to report errors here, with the line number */
	[[maybe_unused]] const UniqueRegex regex(config.pattern, RegexOptions{});

	parent.config.rules.emplace_back(std::move(config));

	ConfigParser::Finish();
}

void
WebCacheConfigParser::ParseLine2(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "max_age") == 0)
		config.max_age = ParseMilliseconds(line);
	else if (strcmp(word, "version") == 0) {
		const char *value = line.NextUnescape();
		if (value == nullptr)
			value = line.ExpectValue();

		line.ExpectEnd();
		config.version = value;
	} else if (strcmp(word, "ignore_querystring") == 0)
		config.ignore_querystring = ParseBool(line);
	else if (strcmp(word, "client_cache") == 0)
		config.client_cache = ParseBool(line);
	else if (strcmp(word, "rule") == 0) {
		const char *pattern = line.NextUnescape();
		if (pattern == nullptr)
			throw LineParser::Error("Quoted regular expression expected");

		if (*pattern == 0)
			throw LineParser::Error("Empty regular expression");

		line.ExpectSymbolAndEol('{');

		SetChild(std::make_unique<Rule>(*this, pattern));
	} else
		throw LineParser::Error("Unknown option");
}

void
WebCacheConfigParser::Finish()
{
	NestedConfigParser::Finish();

	if (config.rules.empty())
		throw LineParser::Error("No rules configured");
}

WebCacheConfig
LoadWebCacheConfigFile(const boost::filesystem::path &path)
{
	WebCacheConfig config;

	WebCacheConfigParser parser(config);
	CommentConfigParser parser2(parser);
	IncludeConfigParser parser3(boost::filesystem::path(path), parser2);

	ParseConfigFile(path, parser3);
	return config;
}

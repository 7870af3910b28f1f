// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem/path.hpp>

#include <memory>

class FileLineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Give this object a chance to handle the line before
	 * ParseLine() gets called.
	 *
	 * @return true if the line has been consumed
	 */
	virtual bool PreParseLine([[maybe_unused]] FileLineParser &line) {
		return false;
	}

	virtual void ParseLine(FileLineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which can dynamically forward method calls to a
 * nested #ConfigParser instance.  A line consisting of "}" closes the
 * nested block.
 */
class NestedConfigParser : public ConfigParser {
	std::unique_ptr<ConfigParser> child;

public:
	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) final;
	void Finish() override;

protected:
	void SetChild(std::unique_ptr<ConfigParser> &&_child) noexcept {
		child = std::move(_child);
	}

	virtual void ParseLine2(FileLineParser &line) = 0;
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;

	void ParseLine(FileLineParser &line) override {
		child.ParseLine(line);
	}

	void Finish() override {
		child.Finish();
	}
};

/**
 * A #ConfigParser which can "@include" other files.  Relative paths
 * are resolved relative to the including file.
 */
class IncludeConfigParser final : public ConfigParser {
	const boost::filesystem::path path;

	ConfigParser &child;

	/**
	 * Does our Finish() override call child.Finish()?  Included
	 * files share the child, which must be finished only once.
	 */
	const bool finish_child;

public:
	IncludeConfigParser(boost::filesystem::path &&_path,
			    ConfigParser &_child,
			    bool _finish_child=true) noexcept
		:path(std::move(_path)), child(_child),
		 finish_child(_finish_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override {
		return child.PreParseLine(line);
	}

	void ParseLine(FileLineParser &line) override;

	void Finish() override {
		if (finish_child)
			child.Finish();
	}
};

/**
 * Feed all lines of the given file into the parser and call its
 * Finish() method.
 *
 * Errors are rethrown nested inside a #LineParser::Error which
 * contains the file name and the line number.
 *
 * Throws std::system_error if the file cannot be opened.
 */
void
ParseConfigFile(const boost::filesystem::path &path, ConfigParser &parser);

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "FileLineParser.hxx"

#include <cerrno>
#include <exception>
#include <memory>
#include <string>
#include <system_error>

#include <stdio.h>

namespace fs = boost::filesystem;

bool
NestedConfigParser::PreParseLine(FileLineParser &line)
{
	if (!child)
		return false;

	if (child->PreParseLine(line))
		return true;

	if (!line.SkipSymbol('}'))
		return false;

	/* end of the nested block */
	line.ExpectEnd();
	child->Finish();
	child.reset();
	return true;
}

void
NestedConfigParser::ParseLine(FileLineParser &line)
{
	if (child)
		child->ParseLine(line);
	else
		ParseLine2(line);
}

void
NestedConfigParser::Finish()
{
	if (child)
		throw FileLineParser::Error("Block not closed at end of file");
}

bool
CommentConfigParser::PreParseLine(FileLineParser &line)
{
	/* empty lines and comments are consumed here */
	return line.IsEnd() || line.front() == '#' ||
		child.PreParseLine(line);
}

void
IncludeConfigParser::ParseLine(FileLineParser &line)
{
	if (!line.SkipWord("@include")) {
		child.ParseLine(line);
		return;
	}

	/* the included file shares our child, which gets finished
	   by the outermost parser only */
	IncludeConfigParser sub(line.ExpectPathAndEnd(), child, false);
	ParseConfigFile(sub.path, sub);
}

namespace {

struct FileCloser {
	void operator()(FILE *file) const noexcept {
		fclose(file);
	}
};

}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	const std::unique_ptr<FILE, FileCloser> file(fopen(path.c_str(), "r"));
	if (!file)
		throw std::system_error(errno, std::system_category(),
					"Failed to open " + path.string());

	char buffer[4096];
	for (unsigned number = 1;
	     fgets(buffer, sizeof(buffer), file.get()) != nullptr;
	     ++number) {
		FileLineParser line(path, buffer);

		try {
			if (!parser.PreParseLine(line))
				parser.ParseLine(line);
		} catch (...) {
			std::throw_with_nested(FileLineParser::Error(path.string() + ':' + std::to_string(number)));
		}
	}

	try {
		parser.Finish();
	} catch (...) {
		std::throw_with_nested(FileLineParser::Error(path.string()));
	}
}

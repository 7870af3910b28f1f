// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LineParser.hxx"

#include <boost/filesystem/path.hpp>

/**
 * A #LineParser which knows the path of the file it is parsing, to
 * be able to resolve relative paths.
 */
class FileLineParser : public LineParser {
	const boost::filesystem::path &base_path;

public:
	FileLineParser(const boost::filesystem::path &_base_path,
		       char *_p) noexcept
		:LineParser(_p), base_path(_base_path) {}

	/**
	 * Expect a quoted path.  A relative path is resolved relative
	 * to the directory of the file being parsed.
	 */
	boost::filesystem::path ExpectPath();
	boost::filesystem::path ExpectPathAndEnd();
};

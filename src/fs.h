// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_FS_H
#define ANCHORING_FS_H

#include <cstdio>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

/** Filesystem operations and types */
namespace fs = boost::filesystem;

/** Read a whole file into a string. Throws std::runtime_error when it cannot be opened. */
std::string ReadFileContents(const fs::path& path);

/** Replace the contents of a file, creating parent directories as needed. */
void WriteFileContents(const fs::path& path, const std::string& contents);

#endif // ANCHORING_FS_H

// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fs.h"

#include "logging.h"

#include <iterator>
#include <stdexcept>

std::string ReadFileContents(const fs::path& path)
{
    fs::ifstream stream(path);
    if (!stream.good()) {
        throw std::runtime_error(strprintf("Unable to open %s", path.string()));
    }
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

void WriteFileContents(const fs::path& path, const std::string& contents)
{
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    fs::ofstream stream(path, std::ios::out | std::ios::trunc);
    if (!stream.good()) {
        throw std::runtime_error(strprintf("Unable to write %s", path.string()));
    }
    stream << contents;
}

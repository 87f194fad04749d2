/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#pragma once

#include <cerrno>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>

#include <Poco/Path.h>

#include <cppunit/extensions/HelperMacros.h>

#include <FileUtil.hpp>
#include <Log.hpp>

#ifndef DEBUG_ABSSRCDIR
#error DEBUG_ABSSRCDIR must be defined (see CMakeLists.txt)
#endif

/// Common helper testing functions.
namespace helpers
{

/// The shipped configuration files.
inline std::string getDefaultsFile() { return DEBUG_ABSSRCDIR "/etc/wopiserver.defaults.conf"; }
inline std::string getSiteFile() { return DEBUG_ABSSRCDIR "/etc/wopiserver.conf"; }

/// A scratch directory, removed with its contents on destruction.
/// Created under the working directory, since tmpfs may lack user xattrs.
class TempDir
{
public:
    TempDir()
        : _path(FileUtil::createRandomTmpDir(Poco::Path::current() + "tmp"))
    {
        // On failure the root itself is returned, never remove that.
        if (_path.find("/wopi-") == std::string::npos)
        {
            throw std::runtime_error("Failed to create a temporary directory");
        }
    }

    ~TempDir() { FileUtil::removeFile(_path, true); }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return _path; }

    /// Absolute path of an entry of the directory.
    std::string operator/(const std::string& name) const { return _path + '/' + name; }

private:
    const std::string _path;
};

inline void writeFile(const std::string& path, const std::string& content)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
    if (!ofs)
    {
        throw std::runtime_error("Failed to write test file [" + path + ']');
    }
}

inline std::string readFile(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

inline bool fileExists(const std::string& path) { return FileUtil::Stat(path).exists(); }

/// Writes an INI file from section.key=value pairs.
inline void writeIni(const std::string& path, const std::map<std::string, std::string>& values)
{
    std::map<std::string, std::map<std::string, std::string>> sections;
    for (const auto& pair : values)
    {
        const std::size_t dot = pair.first.find('.');
        sections[pair.first.substr(0, dot)][pair.first.substr(dot + 1)] = pair.second;
    }

    std::string content = "# generated by unittest\n";
    for (const auto& section : sections)
    {
        content += '[' + section.first + "]\n";
        for (const auto& pair : section.second)
        {
            content += pair.first + " = " + pair.second + '\n';
        }
    }

    writeFile(path, content);
}

/// Fails the running test when the filesystem of dir lacks user xattrs,
/// which the WOPI locks are stored in.
inline void requireXattrSupport(const std::string& dir)
{
    const std::string path = dir + "/.xattr-check";
    writeFile(path, std::string());
    const bool supported = FileUtil::setXattr(path, "check", "1") || errno != ENOTSUP;
    FileUtil::removeFile(path);
    if (!supported)
    {
        CPPUNIT_FAIL("No user extended attributes in [" + dir
                     + "], run the tests from a directory on a filesystem that has them");
    }
}

} // namespace helpers

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

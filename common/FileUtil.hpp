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
#include <ctime>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>

namespace FileUtil
{
    // As open(). Returns the file descriptor. On error returns -1 and sets errno.
    int openFileAsFD(const std::string& file, int oflag, int mode = 0);

    // As close().
    int closeFD(int fd);

    /// Read nbytes from fd into buf. Retries on EINTR.
    /// Returns the number of bytes read, or -1 on error.
    ssize_t read(int fd, void* buf, size_t nbytes);

    /// Write all nbytes from buf to fd. Retries on EINTR and short writes.
    /// Returns false and sets errno on error.
    bool writeAll(int fd, const void* buf, size_t nbytes);

    /// Safely remove a file or directory.
    /// Suppresses exception when the file is already removed.
    void removeFile(const std::string& path, bool recursive = false);

    /// Create randomized temporary directory in the root provided
    /// with S_IRWXU permissions.
    /// If root is empty, the current system temp directory is used.
    std::string createRandomTmpDir(std::string root = std::string());

    /// Returns the system temporary directory.
    std::string getSysTempDirectoryPath();

    /// Extended attributes in the "user." namespace.
    /// The key is given without the namespace prefix.
    /// All return false and set errno on failure.
    bool setXattr(const std::string& path, const std::string& key, const std::string& value);
    bool getXattr(const std::string& path, const std::string& key, std::string& value);
    bool removeXattr(const std::string& path, const std::string& key);

    /// File/Directory stat helper.
    class Stat
    {
    public:
        /// Stat the given path. Symbolic links are stat'ed when @link is true.
        Stat(const std::string& path, bool link = false)
            : _sb{}
            , _res(link ? ::lstat(path.c_str(), &_sb) : ::stat(path.c_str(), &_sb))
            , _stat_errno(errno)
        {
        }

        bool good() const { return _res == 0; }
        bool bad() const { return !good(); }
        int error() const { return good() ? 0 : _stat_errno; }

        bool isDirectory() const { return S_ISDIR(_sb.st_mode); }
        ino_t inodeNumber() const { return _sb.st_ino; }
        uid_t ownerUid() const { return _sb.st_uid; }
        gid_t ownerGid() const { return _sb.st_gid; }

        /// Returns the filesize in bytes.
        std::size_t size() const { return _sb.st_size; }

        /// Returns the modified unix-time in seconds since epoch.
        std::time_t modifiedTime() const { return _sb.st_mtim.tv_sec; }

        /// Returns true iff the path exists, regardless of access permission.
        bool exists() const { return good() || (_stat_errno != ENOENT && _stat_errno != ENOTDIR); }

    private:
        struct ::stat _sb;
        const int _res;
        const int _stat_errno;
    };

} // end namespace FileUtil

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include "FileUtil.hpp"

#include <sys/xattr.h>
#include <unistd.h>

#include <exception>
#include <vector>

#include <Poco/File.h>
#include <Poco/Path.h>

#include "Log.hpp"
#include "Util.hpp"

namespace
{
    /// Linux only allows unprivileged processes in the "user." namespace.
    inline std::string userXattrKey(const std::string& key) { return "user." + key; }
}

namespace FileUtil
{
    int openFileAsFD(const std::string& file, int oflag, int mode)
    {
        return ::open(file.c_str(), oflag | O_CLOEXEC, mode);
    }

    int closeFD(int fd)
    {
        return ::close(fd);
    }

    ssize_t read(int fd, void* buf, size_t nbytes)
    {
        char* p = static_cast<char*>(buf);

        while (nbytes)
        {
            const ssize_t n = ::read(fd, p, nbytes);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;

                return -1; // Error.
            }

            if (n == 0) // EOF.
                break;

            nbytes -= n;
            p += n;
        }

        return p - static_cast<char*>(buf);
    }

    bool writeAll(int fd, const void* buf, size_t nbytes)
    {
        const char* p = static_cast<const char*>(buf);

        while (nbytes)
        {
            const ssize_t n = ::write(fd, p, nbytes);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;

                return false;
            }

            nbytes -= n;
            p += n;
        }

        return true;
    }

    void removeFile(const std::string& path, const bool recursive)
    {
        LOG_DBG("Removing [" << path << "] " << (recursive ? "recursively." : "only."));

        try
        {
            Poco::File(path).remove(recursive);
        }
        catch (const std::exception& e)
        {
            // Don't complain if already non-existent.
            if (FileUtil::Stat(path).exists())
            {
                // Error only if it still exists.
                LOG_ERR("Failed to remove [" << path << "] "
                                             << (recursive ? "recursively: " : "only: ") << e.what());
            }
        }
    }

    std::string getSysTempDirectoryPath()
    {
        std::string path = Poco::Path::temp();
        while (path.size() > 1 && path.back() == '/')
            path.pop_back();

        return path.empty() ? std::string("/tmp") : path;
    }

    std::string createRandomTmpDir(std::string root)
    {
        if (root.empty())
            root = getSysTempDirectoryPath();

        Poco::File(root).createDirectories();

        // Don't const to allow for automatic move on return.
        std::string newTmp = root + "/wopi-" + Util::rng::getHardRandomHexString(8);
        if (::mkdir(newTmp.c_str(), S_IRWXU) < 0)
        {
            LOG_SYS("Failed to create random temp directory [" << newTmp << ']');
            return root;
        }
        return newTmp;
    }

    bool setXattr(const std::string& path, const std::string& key, const std::string& value)
    {
        return ::setxattr(path.c_str(), userXattrKey(key).c_str(), value.data(), value.size(), 0)
               == 0;
    }

    bool getXattr(const std::string& path, const std::string& key, std::string& value)
    {
        const std::string fullKey = userXattrKey(key);
        const ssize_t size = ::getxattr(path.c_str(), fullKey.c_str(), nullptr, 0);
        if (size < 0)
            return false;

        std::vector<char> buffer(size);
        const ssize_t read = ::getxattr(path.c_str(), fullKey.c_str(), buffer.data(), buffer.size());
        if (read < 0)
            return false;

        value.assign(buffer.data(), read);
        return true;
    }

    bool removeXattr(const std::string& path, const std::string& key)
    {
        return ::removexattr(path.c_str(), userXattrKey(key).c_str()) == 0;
    }

} // namespace FileUtil

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

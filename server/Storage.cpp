/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include "Storage.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <Exceptions.hpp>
#include <FileUtil.hpp>
#include <Log.hpp>
#include <Util.hpp>

#include "WopiConfig.hpp"

namespace
{
/// Translates a failed system call on a file into the matching exception.
[[noreturn]] void throwStorageError(const std::string& operation, const std::string& path,
                                    int err)
{
    const std::string msg =
        operation + " failed for [" + path + "]: " + std::strerror(err);
    switch (err)
    {
        case ENOENT:
        case ENOTDIR:
            throw FileNotFoundException(msg);
        case EISDIR:
            throw IsADirectoryException(msg);
        case EEXIST:
            throw FileExistsException(msg);
        default:
            throw StorageException(msg);
    }
}
}

std::unique_ptr<StorageBase> StorageBase::create(const WopiConfig& config)
{
    const std::string type = config.getStorageType();
    if (type == "local")
    {
        return std::unique_ptr<StorageBase>(new LocalStorage(config.getStorageHomePath()));
    }

    if (type == "xroot")
    {
        throw ConfigException("Unsupported storage type [xroot]: no XRootD client available");
    }

    throw ConfigException("Unsupported storage type [" + type + ']');
}

LocalStorage::LocalStorage(const std::string& homePath)
    : _homePath(homePath)
{
    while (_homePath.size() > 1 && _homePath.back() == '/')
        _homePath.pop_back();

    const FileUtil::Stat st(_homePath);
    if (_homePath.empty() || !st.good() || !st.isDirectory())
    {
        throw ConfigException("local.storagehomepath: [" + homePath
                              + "] is not an existing directory");
    }

    LOG_INF("LocalStorage ctor with homePath: [" << _homePath << ']');
}

std::string LocalStorage::getLocalPath(const std::string& path) const
{
    for (const std::string& component : Util::splitStringToVector(path, '/'))
    {
        if (component == "..")
        {
            throw BadRequestException("Invalid path [" + path + ']');
        }
    }

    if (path.find('\0') != std::string::npos)
    {
        throw BadRequestException("Invalid path");
    }

    return _homePath + (Util::startsWith(path, "/") ? path : '/' + path);
}

StorageBase::FileInfo LocalStorage::stat(const std::string& path, const std::string& userId)
{
    const std::string localPath = getLocalPath(path);
    LOG_TRC("Stat [" << localPath << "] for user " << userId);

    const FileUtil::Stat st(localPath);
    if (st.bad())
    {
        throwStorageError("stat", path, st.error());
    }

    if (st.isDirectory())
    {
        throw IsADirectoryException("[" + path + "] is a directory");
    }

    return FileInfo(std::to_string(st.inodeNumber()), path,
                    std::to_string(st.ownerUid()) + ':' + std::to_string(st.ownerGid()), st.size(),
                    st.modifiedTime());
}

bool LocalStorage::exists(const std::string& path, const std::string& userId)
{
    LOG_TRC("Exists [" << path << "] for user " << userId);
    return FileUtil::Stat(getLocalPath(path)).exists();
}

void LocalStorage::readFile(const std::string& path, const std::string& userId,
                            std::size_t chunkSize, const ChunkSink& sink)
{
    const std::string localPath = getLocalPath(path);
    LOG_DBG("Reading [" << localPath << "] for user " << userId << " in chunks of "
                        << chunkSize << " bytes");

    const int fd = FileUtil::openFileAsFD(localPath, O_RDONLY);
    if (fd < 0)
    {
        throwStorageError("open", path, errno);
    }

    std::vector<char> buffer(chunkSize > 0 ? chunkSize : 1);
    std::size_t total = 0;
    try
    {
        for (;;)
        {
            const ssize_t n = FileUtil::read(fd, buffer.data(), buffer.size());
            if (n < 0)
            {
                throwStorageError("read", path, errno);
            }

            if (n == 0)
                break;

            sink(buffer.data(), static_cast<std::size_t>(n));
            total += n;
        }
    }
    catch (...)
    {
        FileUtil::closeFD(fd);
        throw;
    }

    FileUtil::closeFD(fd);
    LOG_TRC("Read " << total << " bytes from [" << localPath << ']');
}

void LocalStorage::writeFile(const std::string& path, const std::string& userId,
                             const std::string& content, bool isLock)
{
    const std::string localPath = getLocalPath(path);
    LOG_DBG("Writing " << content.size() << " bytes to [" << localPath << "] for user "
                       << userId << (isLock ? " exclusively" : ""));

    const int flags = O_WRONLY | O_CREAT | (isLock ? O_EXCL : O_TRUNC);
    const int fd = FileUtil::openFileAsFD(localPath, flags, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (fd < 0)
    {
        throwStorageError("open", path, errno);
    }

    if (!FileUtil::writeAll(fd, content.data(), content.size()))
    {
        const int err = errno;
        FileUtil::closeFD(fd);
        throwStorageError("write", path, err);
    }

    if (FileUtil::closeFD(fd) != 0)
    {
        throwStorageError("close", path, errno);
    }
}

void LocalStorage::setXattr(const std::string& path, const std::string& userId,
                            const std::string& key, const std::string& value)
{
    LOG_TRC("Setting xattr " << key << '=' << value << " on [" << path << "] for user "
                             << userId);
    if (!FileUtil::setXattr(getLocalPath(path), key, value))
    {
        const int err = errno;
        throwStorageError("setxattr " + key, path, err);
    }
}

std::string LocalStorage::getXattr(const std::string& path, const std::string& userId,
                                   const std::string& key)
{
    LOG_TRC("Getting xattr " << key << " of [" << path << "] for user " << userId);
    std::string value;
    if (!FileUtil::getXattr(getLocalPath(path), key, value))
    {
        const int err = errno;
        if (err == ENODATA)
        {
            return std::string();
        }

        throwStorageError("getxattr " + key, path, err);
    }

    return value;
}

void LocalStorage::rmXattr(const std::string& path, const std::string& userId,
                           const std::string& key)
{
    LOG_TRC("Removing xattr " << key << " of [" << path << "] for user " << userId);
    if (!FileUtil::removeXattr(getLocalPath(path), key))
    {
        const int err = errno;
        if (err != ENODATA)
        {
            throwStorageError("removexattr " + key, path, err);
        }
    }
}

void LocalStorage::renameFile(const std::string& fromPath, const std::string& toPath,
                              const std::string& userId)
{
    LOG_DBG("Renaming [" << fromPath << "] to [" << toPath << "] for user " << userId);
    if (std::rename(getLocalPath(fromPath).c_str(), getLocalPath(toPath).c_str()) != 0)
    {
        throwStorageError("rename", fromPath, errno);
    }
}

void LocalStorage::removeFile(const std::string& path, const std::string& userId)
{
    LOG_DBG("Removing [" << path << "] for user " << userId);
    if (::unlink(getLocalPath(path).c_str()) != 0)
    {
        throwStorageError("unlink", path, errno);
    }
}

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

// Storage abstraction.

#pragma once

#include <cstddef>
#include <ctime>
#include <functional>
#include <memory>
#include <string>

class WopiConfig;

/// Base class of all Storage abstractions.
/// Paths are relative to the storage root; every operation is
/// performed on behalf of a user, identified as ruid:rgid.
class StorageBase
{
public:
    /// Represents a file's attributes.
    class FileInfo
    {
    public:
        FileInfo(const std::string& fileId, const std::string& path, const std::string& ownerId,
                 std::size_t size, std::time_t modifiedTime)
            : _fileId(fileId)
            , _path(path)
            , _ownerId(ownerId)
            , _size(size)
            , _modifiedTime(modifiedTime)
        {
        }

        const std::string& getFileId() const { return _fileId; }
        const std::string& getPath() const { return _path; }
        const std::string& getOwnerId() const { return _ownerId; }
        std::size_t getSize() const { return _size; }
        std::time_t getModifiedTime() const { return _modifiedTime; }

    private:
        std::string _fileId;
        std::string _path;
        std::string _ownerId;
        std::size_t _size;
        std::time_t _modifiedTime;
    };

    /// Receives the file contents, one chunk at a time.
    using ChunkSink = std::function<void(const char* data, std::size_t size)>;

    virtual ~StorageBase() {}

    /// Returns information about the file.
    /// Throws FileNotFoundException, IsADirectoryException or StorageException.
    virtual FileInfo stat(const std::string& path, const std::string& userId) = 0;

    /// Returns true iff something exists at the given path.
    virtual bool exists(const std::string& path, const std::string& userId) = 0;

    /// Streams the whole content of the file to sink in chunks of at most chunkSize bytes.
    virtual void readFile(const std::string& path, const std::string& userId,
                          std::size_t chunkSize, const ChunkSink& sink) = 0;

    /// Replaces the content of the file, creating it if needed.
    /// With isLock the file is created exclusively, and FileExistsException
    /// is thrown if it is already present.
    virtual void writeFile(const std::string& path, const std::string& userId,
                           const std::string& content, bool isLock = false) = 0;

    virtual void setXattr(const std::string& path, const std::string& userId,
                          const std::string& key, const std::string& value) = 0;

    /// Returns an empty string when the attribute is not set.
    virtual std::string getXattr(const std::string& path, const std::string& userId,
                                 const std::string& key) = 0;

    /// Removing an attribute that is not set is not an error.
    virtual void rmXattr(const std::string& path, const std::string& userId,
                         const std::string& key) = 0;

    virtual void renameFile(const std::string& fromPath, const std::string& toPath,
                            const std::string& userId) = 0;

    virtual void removeFile(const std::string& path, const std::string& userId) = 0;

    /// Storage object creation factory, selected by general.storagetype.
    /// Throws ConfigException for unsupported types or invalid settings.
    static std::unique_ptr<StorageBase> create(const WopiConfig& config);
};

/// Storage on a local (or locally mounted) filesystem, rooted at local.storagehomepath.
class LocalStorage : public StorageBase
{
public:
    explicit LocalStorage(const std::string& homePath);

    FileInfo stat(const std::string& path, const std::string& userId) override;

    bool exists(const std::string& path, const std::string& userId) override;

    void readFile(const std::string& path, const std::string& userId, std::size_t chunkSize,
                  const ChunkSink& sink) override;

    void writeFile(const std::string& path, const std::string& userId,
                   const std::string& content, bool isLock = false) override;

    void setXattr(const std::string& path, const std::string& userId, const std::string& key,
                  const std::string& value) override;

    std::string getXattr(const std::string& path, const std::string& userId,
                         const std::string& key) override;

    void rmXattr(const std::string& path, const std::string& userId,
                 const std::string& key) override;

    void renameFile(const std::string& fromPath, const std::string& toPath,
                    const std::string& userId) override;

    void removeFile(const std::string& path, const std::string& userId) override;

private:
    /// Maps a storage path to the local filesystem.
    /// Throws BadRequestException for paths escaping the root.
    std::string getLocalPath(const std::string& path) const;

private:
    std::string _homePath;
};

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

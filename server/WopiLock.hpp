/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

// WOPI locks, stored as extended attributes next to the document.

#pragma once

#include <ctime>
#include <mutex>
#include <string>

class StorageBase;
class WopiConfig;

namespace WopiLock
{
    /// Extended attribute holding the current lock as {"wopilock":id,"exp":t}.
    constexpr const char* LockKey = "oc.wopi.lock";

    /// Extended attribute holding the time of the last save through WOPI.
    constexpr const char* LastWriteTimeKey = "oc.wopi.lastwritetime";

    /// Locks expire this many seconds after being set or refreshed.
    constexpr std::time_t LockExpirySecs = 1800;

    /// Returns the path of the LibreOffice-compatible lock file of a document:
    /// .~lock.<name># in the same folder.
    std::string getLibreOfficeLockPath(const std::string& path);

    /// Serializes a lock for storage.
    std::string encodeLock(const std::string& lockId, std::time_t expiry);

    /// Parses a stored lock. Returns false when malformed.
    bool decodeLock(const std::string& value, std::string& lockId, std::time_t& expiry);
}

/// Outcome of a lock operation.
struct LockResult
{
    bool success = true;
    /// The lock in place after the operation, empty when none.
    std::string currentLock;
    /// Set on failure, sent as X-WOPI-LockFailureReason.
    std::string reason;

    static LockResult ok(const std::string& lock) { return LockResult{ true, lock, std::string() }; }
    static LockResult conflict(const std::string& lock, const std::string& reason)
    {
        return LockResult{ false, lock, reason };
    }
};

/// Implements the WOPI lock state machine on top of a storage backend.
/// All operations are serialized.
class LockManager
{
public:
    LockManager(StorageBase& storage, const WopiConfig& config);

    /// Returns the unexpired lock id of the file, empty when unlocked.
    std::string getLock(const std::string& path, const std::string& userId, std::time_t now);

    /// LOCK: locks an unlocked file, or refreshes a lock held with the same id.
    LockResult lock(const std::string& path, const std::string& userId,
                    const std::string& lockId, std::time_t now);

    /// LOCK with X-WOPI-OldLock: replaces oldLockId with lockId.
    LockResult unlockAndRelock(const std::string& path, const std::string& userId,
                               const std::string& lockId, const std::string& oldLockId,
                               std::time_t now);

    /// REFRESH_LOCK: extends the expiry of a lock held with the same id.
    LockResult refreshLock(const std::string& path, const std::string& userId,
                           const std::string& lockId, std::time_t now);

    /// UNLOCK: removes a lock held with the same id.
    LockResult unlock(const std::string& path, const std::string& userId,
                      const std::string& lockId, std::time_t now);

    /// Time of the last WOPI save, 0 when unknown.
    std::time_t getLastWriteTime(const std::string& path, const std::string& userId);

    void setLastWriteTime(const std::string& path, const std::string& userId, std::time_t time);

    /// Serializes operations that must not interleave with lock changes (PutFile and friends).
    /// The lock operations above take it too, so it may be held while calling them.
    std::unique_lock<std::recursive_mutex> acquire()
    {
        return std::unique_lock<std::recursive_mutex>(_mutex);
    }

private:
    void storeLock(const std::string& path, const std::string& userId,
                   const std::string& lockId, std::time_t now);

    /// Creates the LibreOffice lock file for office documents.
    /// Returns false when a foreign lock file is in the way.
    bool createLibreOfficeLock(const std::string& path, const std::string& userId,
                               std::time_t now);

    void removeLibreOfficeLock(const std::string& path, const std::string& userId);

private:
    StorageBase& _storage;
    const WopiConfig& _config;
    std::recursive_mutex _mutex;
};

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

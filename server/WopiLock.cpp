/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include "WopiLock.hpp"

#include <sstream>

#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include <Exceptions.hpp>
#include <Log.hpp>
#include <Util.hpp>

#include "Storage.hpp"
#include "WopiConfig.hpp"

namespace
{
/// Owner name written in LibreOffice lock files we create.
const std::string LockFileOwner = "WOPI Server";

std::string getLockFileContent(std::time_t now)
{
    std::tm tm;
    localtime_r(&now, &tm);
    char date[32];
    strftime(date, sizeof(date), "%d.%m.%Y %H:%M", &tm);

    // ,<user>,<host>,<date>,<home>;
    return ',' + LockFileOwner + ',' + Util::getHostName() + ',' + date + ",;";
}
}

namespace WopiLock
{
    std::string getLibreOfficeLockPath(const std::string& path)
    {
        const auto split = Util::splitPath(path);
        const std::string lockName = ".~lock." + split.second + '#';
        if (split.first.empty())
        {
            return lockName;
        }

        return (split.first == "/" ? split.first : split.first + '/') + lockName;
    }

    std::string encodeLock(const std::string& lockId, std::time_t expiry)
    {
        Poco::JSON::Object lock;
        lock.set("wopilock", lockId);
        lock.set("exp", static_cast<Poco::Int64>(expiry));

        std::ostringstream oss;
        lock.stringify(oss);
        return oss.str();
    }

    bool decodeLock(const std::string& value, std::string& lockId, std::time_t& expiry)
    {
        try
        {
            Poco::JSON::Parser parser;
            Poco::JSON::Object::Ptr lock = parser.parse(value).extract<Poco::JSON::Object::Ptr>();
            if (!lock || !lock->has("wopilock") || !lock->has("exp"))
            {
                return false;
            }

            lockId = lock->get("wopilock").convert<std::string>();
            expiry = static_cast<std::time_t>(lock->get("exp").convert<Poco::Int64>());
            return true;
        }
        catch (const Poco::Exception& exc)
        {
            LOG_WRN("Malformed WOPI lock [" << value << "]: " << exc.displayText());
        }

        return false;
    }
}

LockManager::LockManager(StorageBase& storage, const WopiConfig& config)
    : _storage(storage)
    , _config(config)
{
}

std::string LockManager::getLock(const std::string& path, const std::string& userId,
                                 std::time_t now)
{
    auto guard = acquire();

    const std::string value = _storage.getXattr(path, userId, WopiLock::LockKey);
    if (value.empty())
    {
        return std::string();
    }

    std::string lockId;
    std::time_t expiry = 0;
    if (!WopiLock::decodeLock(value, lockId, expiry))
    {
        return std::string();
    }

    if (expiry < now)
    {
        LOG_DBG("Lock [" << lockId << "] on [" << path << "] expired at " << expiry);
        return std::string();
    }

    return lockId;
}

void LockManager::storeLock(const std::string& path, const std::string& userId,
                            const std::string& lockId, std::time_t now)
{
    _storage.setXattr(path, userId, WopiLock::LockKey,
                      WopiLock::encodeLock(lockId, now + WopiLock::LockExpirySecs));
}

LockResult LockManager::lock(const std::string& path, const std::string& userId,
                             const std::string& lockId, std::time_t now)
{
    auto guard = acquire();

    const std::string current = getLock(path, userId, now);
    if (current.empty())
    {
        if (_config.isOfficeType(path) && !createLibreOfficeLock(path, userId, now))
        {
            return LockResult::conflict(std::string(), "File is open in another application");
        }

        try
        {
            storeLock(path, userId, lockId, now);
        }
        catch (const std::exception& exc)
        {
            LOG_ERR("Failed to lock [" << path << "] with [" << lockId << "]: " << exc.what());
            removeLibreOfficeLock(path, userId);
            throw;
        }

        // On first lock, remember the time for later conflict checks.
        try
        {
            setLastWriteTime(path, userId, now);
        }
        catch (const StorageException& exc)
        {
            // Not fatal, but the next save will produce a conflicting copy.
            LOG_WRN("Unable to set " << WopiLock::LastWriteTimeKey << " on [" << path
                                     << "]: " << exc.what());
        }

        LOG_INF("Locked [" << path << "] with [" << lockId << "] for user " << userId);
        return LockResult::ok(lockId);
    }

    if (current == lockId)
    {
        storeLock(path, userId, lockId, now);
        LOG_DBG("Refreshed lock [" << lockId << "] on [" << path << ']');
        return LockResult::ok(lockId);
    }

    LOG_INF("Lock of [" << path << "] with [" << lockId << "] failed, currently locked with ["
                        << current << ']');
    return LockResult::conflict(current, "File already locked with a different lock");
}

LockResult LockManager::unlockAndRelock(const std::string& path, const std::string& userId,
                                        const std::string& lockId,
                                        const std::string& oldLockId, std::time_t now)
{
    auto guard = acquire();

    const std::string current = getLock(path, userId, now);
    if (current.empty())
    {
        return LockResult::conflict(current, "File not locked");
    }

    if (current != oldLockId)
    {
        return LockResult::conflict(current, "Old lock does not match the current lock");
    }

    storeLock(path, userId, lockId, now);
    LOG_INF("Relocked [" << path << "] from [" << oldLockId << "] to [" << lockId << ']');
    return LockResult::ok(lockId);
}

LockResult LockManager::refreshLock(const std::string& path, const std::string& userId,
                                    const std::string& lockId, std::time_t now)
{
    auto guard = acquire();

    const std::string current = getLock(path, userId, now);
    if (current.empty())
    {
        return LockResult::conflict(current, "File not locked");
    }

    if (current != lockId)
    {
        return LockResult::conflict(current, "Lock mismatch");
    }

    storeLock(path, userId, lockId, now);
    return LockResult::ok(lockId);
}

LockResult LockManager::unlock(const std::string& path, const std::string& userId,
                               const std::string& lockId, std::time_t now)
{
    auto guard = acquire();

    const std::string current = getLock(path, userId, now);
    if (current.empty())
    {
        return LockResult::conflict(current, "File not locked");
    }

    if (current != lockId)
    {
        return LockResult::conflict(current, "Lock mismatch");
    }

    _storage.rmXattr(path, userId, WopiLock::LockKey);
    _storage.rmXattr(path, userId, WopiLock::LastWriteTimeKey);
    removeLibreOfficeLock(path, userId);

    LOG_INF("Unlocked [" << path << "] with [" << lockId << ']');
    return LockResult::ok(std::string());
}

std::time_t LockManager::getLastWriteTime(const std::string& path, const std::string& userId)
{
    const std::string value = _storage.getXattr(path, userId, WopiLock::LastWriteTimeKey);
    const auto pair = Util::i64FromString(value);
    return pair.second ? static_cast<std::time_t>(pair.first) : 0;
}

void LockManager::setLastWriteTime(const std::string& path, const std::string& userId,
                                   std::time_t time)
{
    _storage.setXattr(path, userId, WopiLock::LastWriteTimeKey, std::to_string(time));
}

bool LockManager::createLibreOfficeLock(const std::string& path, const std::string& userId,
                                        std::time_t now)
{
    const std::string lockPath = WopiLock::getLibreOfficeLockPath(path);
    try
    {
        _storage.writeFile(lockPath, userId, getLockFileContent(now), /*isLock=*/true);
        LOG_DBG("Created lock file [" << lockPath << ']');
        return true;
    }
    catch (const FileExistsException&)
    {
        std::string existing;
        _storage.readFile(lockPath, userId, 4096,
                          [&existing](const char* data, std::size_t size)
                          { existing.append(data, size); });

        // Left behind by an earlier session of ours.
        if (existing.find(',' + LockFileOwner + ',') != std::string::npos)
        {
            LOG_DBG("Reusing lock file [" << lockPath << ']');
            return true;
        }

        LOG_WRN("Found foreign lock file [" << lockPath << "]: " << existing);
        return false;
    }
}

void LockManager::removeLibreOfficeLock(const std::string& path, const std::string& userId)
{
    if (!_config.isOfficeType(path))
    {
        return;
    }

    const std::string lockPath = WopiLock::getLibreOfficeLockPath(path);
    try
    {
        _storage.removeFile(lockPath, userId);
    }
    catch (const FileNotFoundException&)
    {
        LOG_DBG("Lock file [" << lockPath << "] already removed");
    }
}

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include "WopiService.hpp"

#include <sstream>

#include <openssl/crypto.h>

#include <Poco/JSON/Object.h>

#include <Exceptions.hpp>
#include <Log.hpp>
#include <Util.hpp>

#include "Storage.hpp"
#include "WopiConfig.hpp"

using Poco::Net::HTTPResponse;

namespace
{
/// Upper bound of the numeric suffixes tried to find a free file name.
constexpr int MaxNameAttempts = 1000;

/// Joins a folder, as returned by Util::splitPath, and a file name.
std::string joinPath(const std::string& folder, const std::string& name)
{
    if (folder.empty())
        return name;

    return folder == "/" ? folder + name : folder + '/' + name;
}

/// A file name is a single, non-empty path component without reserved characters.
bool isValidFileName(const std::string& name)
{
    return !name.empty() && name != "." && name != ".."
           && name.find_first_of(std::string("/\\:*?\"<>|\0", 10)) == std::string::npos;
}

std::string toJson(const Poco::JSON::Object& object)
{
    std::ostringstream oss;
    object.stringify(oss);
    return oss.str();
}

/// Strips the IPv4-mapped IPv6 prefix for comparisons.
std::string normalizeAddress(const std::string& address)
{
    static const std::string mapped = "::ffff:";
    if (Util::startsWith(address, mapped) && address.find('.') != std::string::npos)
    {
        return address.substr(mapped.size());
    }

    return address;
}

std::string requireHeader(const WopiRequest& request, const std::string& name)
{
    if (!request.headers.has(name))
    {
        throw BadRequestException("Missing header " + name + " in POST request");
    }

    return request.getHeader(name);
}
}

WopiService::WopiService(WopiConfig& config, StorageBase& storage,
                         const std::string& wopiSecret, const std::string& iopSecret)
    : _config(config)
    , _storage(storage)
    , _auth(wopiSecret)
    , _iopSecret(iopSecret)
    , _lockManager(storage, config)
    , _wopiUrl(config.getWopiUrl())
{
    LOG_INF("WOPI service ready, WOPISrc base is " << _wopiUrl << "/wopi/files/");
}

WopiReply WopiService::index() const
{
    std::ostringstream oss;
    oss << "<html><head><title>WOPI Server</title></head><body>\n"
        << "<div align=\"center\" style=\"color:#000080; padding-top:50px; font-family:Verdana\">\n"
        << "This is a <a href=\"https://wopi.readthedocs.io\">WOPI</a> server for Office Online"
        << " style editors.<br>\n"
        << "To use this service, open your documents from your storage frontend.</div>\n"
        << "<br><br><hr>\n"
        << "<i>WOPI Server " << WOPISERVER_VERSION << "</i>\n"
        << "</body></html>\n";

    return WopiReply(HTTPResponse::HTTP_OK, oss.str(), "text/html");
}

bool WopiService::isAllowedClient(const std::string& clientAddress) const
{
    const std::string client = normalizeAddress(clientAddress);
    for (const std::string& host : _config.getAllowedClients())
    {
        for (const std::string& address : Util::resolveAddresses(host))
        {
            if (normalizeAddress(address) == client)
            {
                return true;
            }
        }
    }

    return false;
}

std::string WopiService::getWopiSrc(const std::string& fileId) const
{
    return _wopiUrl + "/wopi/files/" + fileId;
}

std::string WopiService::issueToken(const AccessToken& claims, const std::string& path,
                                    std::time_t mtime, std::time_t now) const
{
    AccessToken token;
    token.ruid = claims.ruid;
    token.rgid = claims.rgid;
    token.filename = path;
    token.canEdit = claims.canEdit;
    token.mtime = mtime;
    token.exp = now + _config.getTokenValidity();

    LOG_DBG("Issuing access token for user " << token.userId() << " filename [" << path
                                             << "] canedit " << token.canEdit << " mtime "
                                             << mtime << " expiration " << token.exp);
    return _auth.getAccessToken(token);
}

AccessToken WopiService::authorize(const WopiRequest& request, std::time_t now) const
{
    const std::string accessToken = request.getParam("access_token");
    if (accessToken.empty())
    {
        LOG_WRN("Missing access token from " << request.clientAddress);
        throw UnauthorizedRequestException("Invalid access token");
    }

    try
    {
        return _auth.verify(accessToken, now);
    }
    catch (const UnauthorizedRequestException&)
    {
        LOG_WRN("Signature verification failed for token [" << Log::abbreviate(accessToken)
                                                             << "] from "
                                                             << request.clientAddress);
        throw;
    }
}

void WopiService::requireEdit(const AccessToken& token, const std::string& operation)
{
    if (!token.canEdit)
    {
        LOG_WRN(operation << " refused on read-only access to [" << token.filename
                          << "] for user " << token.userId());
        throw UnauthorizedRequestException("Unauthorized, file opened read-only");
    }
}

WopiReply WopiService::lockConflict(const std::string& currentLock, const std::string& reason)
{
    WopiReply reply(HTTPResponse::HTTP_CONFLICT, reason);
    reply.headers.set("X-WOPI-Lock", currentLock);
    reply.headers.set("X-WOPI-LockFailureReason", reason);
    return reply;
}

std::string WopiService::findAvailableName(const std::string& folder, const std::string& base,
                                           const std::string& ext, const std::string& userId)
{
    // Try <base><ext>, then <base>_1<ext> up to <base>_<MaxNameAttempts><ext>.
    for (int i = 0; i <= MaxNameAttempts; ++i)
    {
        const std::string name = (i == 0 ? base : base + '_' + std::to_string(i)) + ext;
        if (!_storage.exists(joinPath(folder, name), userId))
        {
            return name;
        }
    }

    throw StorageException("No available name for [" + base + ext + "] in [" + folder + ']');
}

WopiReply WopiService::open(const WopiRequest& request, bool iop, std::time_t now)
{
    if (iop)
    {
        const std::string expected = "Bearer " + _iopSecret;
        const std::string authorization = request.getHeader("Authorization");
        if (authorization.size() != expected.size()
            || CRYPTO_memcmp(authorization.data(), expected.data(), expected.size()) != 0)
        {
            LOG_WRN("Unauthorized open attempt from " << request.clientAddress);
            throw UnauthorizedRequestException("Client not authorized");
        }
    }
    else if (!isAllowedClient(request.clientAddress))
    {
        LOG_WRN("Unauthorized access attempt from client " << request.clientAddress);
        throw UnauthorizedRequestException("Client IP not authorized");
    }

    for (const char* name : { "ruid", "rgid", "filename" })
    {
        if (request.getParam(name).empty())
        {
            throw BadRequestException(std::string("Missing argument ") + name);
        }
    }

    AccessToken claims;
    claims.ruid = request.getParam("ruid");
    claims.rgid = request.getParam("rgid");
    claims.canEdit = Util::toLower(request.getParam("canedit")) == "yes";

    const std::string filename = request.getParam("filename");
    const StorageBase::FileInfo info = _storage.stat(filename, claims.userId());
    const std::string token = issueToken(claims, filename, info.getModifiedTime(), now);

    LOG_INF("Access token set for client " << request.clientAddress << " user "
                                           << claims.userId() << " filename [" << filename
                                           << "] canedit " << claims.canEdit << " inode "
                                           << info.getFileId() << " token ["
                                           << Log::abbreviate(token) << ']');

    // The token is URL-safe already.
    return WopiReply(HTTPResponse::HTTP_OK,
                     Util::quotePlus(getWopiSrc(info.getFileId())) + "&access_token=" + token);
}

WopiReply WopiService::checkFileInfo(const WopiRequest& request, std::time_t now)
{
    const AccessToken token = authorize(request, now);
    LOG_INF("CheckFileInfo user " << token.userId() << " filename [" << token.filename
                                  << "] fileid " << request.fileId);

    const StorageBase::FileInfo info = _storage.stat(token.filename, token.userId());
    const auto split = Util::splitPath(token.filename);

    Poco::JSON::Object fileInfo;
    fileInfo.set("BaseFileName", split.second);
    fileInfo.set("OwnerId", info.getOwnerId());
    fileInfo.set("UserId", token.userId());
    fileInfo.set("Size", static_cast<Poco::UInt64>(info.getSize()));
    fileInfo.set("Version", std::to_string(info.getModifiedTime()));
    fileInfo.set("LastModifiedTime", Util::getIso8601Time(info.getModifiedTime()));
    fileInfo.set("SupportsUpdate", token.canEdit);
    fileInfo.set("UserCanWrite", token.canEdit);
    fileInfo.set("SupportsLocks", token.canEdit);
    fileInfo.set("SupportsGetLock", token.canEdit);
    fileInfo.set("SupportsRename", token.canEdit);
    fileInfo.set("UserCanRename", token.canEdit);
    fileInfo.set("SupportsDeleteFile", token.canEdit);
    fileInfo.set("UserCanNotWriteRelative", !token.canEdit);
    fileInfo.set("DownloadUrl", _config.getDownloadUrl() + "?dir=" + Util::quotePlus(split.first)
                                    + "&files=" + Util::quotePlus(split.second));

    return WopiReply(HTTPResponse::HTTP_OK, toJson(fileInfo), "application/json");
}

WopiReply WopiService::getFile(const WopiRequest& request, std::time_t now)
{
    const AccessToken token = authorize(request, now);
    LOG_INF("GetFile user " << token.userId() << " filename [" << token.filename << "] fileid "
                            << request.fileId);

    // Fail before any byte of the body goes out.
    _storage.stat(token.filename, token.userId());

    WopiReply reply(HTTPResponse::HTTP_OK, std::string(), "application/octet-stream");
    reply.headers.set("X-WOPI-ItemVersion", std::to_string(token.mtime));

    const std::string path = token.filename;
    const std::string userId = token.userId();
    const std::size_t chunkSize = _config.getChunkSize();
    StorageBase& storage = _storage;
    reply.bodyWriter = [&storage, path, userId, chunkSize](std::ostream& os)
    {
        storage.readFile(path, userId, chunkSize,
                         [&os](const char* data, std::size_t size) { os.write(data, size); });
    };

    return reply;
}

WopiReply WopiService::postFile(const WopiRequest& request, std::time_t now)
{
    const AccessToken token = authorize(request, now);
    const std::string op = requireHeader(request, "X-WOPI-Override");

    if (op != "LOCK" && op != "REFRESH_LOCK" && op != "UNLOCK" && op != "GET_LOCK"
        && op != "PUT_RELATIVE" && op != "DELETE_FILE" && op != "RENAME_FILE")
    {
        throw BadRequestException("Unknown operation " + op + " found in header");
    }

    if (op != "GET_LOCK")
    {
        requireEdit(token, op);
    }

    if (op == "LOCK")
        return lock(request, token, now);
    if (op == "REFRESH_LOCK")
        return refreshLock(request, token, now);
    if (op == "UNLOCK")
        return unlock(request, token, now);
    if (op == "GET_LOCK")
        return getLock(request, token, now);
    if (op == "PUT_RELATIVE")
        return putRelativeFile(request, token, now);
    if (op == "DELETE_FILE")
        return deleteFile(request, token, now);

    return renameFile(request, token, now);
}

WopiReply WopiService::lock(const WopiRequest& request, const AccessToken& token, std::time_t now)
{
    const std::string lockId = requireHeader(request, "X-WOPI-Lock");

    LockResult result;
    if (request.headers.has("X-WOPI-OldLock"))
    {
        const std::string oldLockId = request.getHeader("X-WOPI-OldLock");
        LOG_INF("UnlockAndRelock user " << token.userId() << " filename [" << token.filename
                                        << "] fileid " << request.fileId << " lock [" << lockId
                                        << "] oldlock [" << oldLockId << ']');
        result = _lockManager.unlockAndRelock(token.filename, token.userId(), lockId, oldLockId,
                                              now);
    }
    else
    {
        LOG_INF("Lock user " << token.userId() << " filename [" << token.filename << "] fileid "
                             << request.fileId << " lock [" << lockId << ']');
        result = _lockManager.lock(token.filename, token.userId(), lockId, now);
    }

    if (!result.success)
    {
        return lockConflict(result.currentLock, result.reason);
    }

    return WopiReply();
}

WopiReply WopiService::refreshLock(const WopiRequest& request, const AccessToken& token,
                                   std::time_t now)
{
    const std::string lockId = requireHeader(request, "X-WOPI-Lock");
    LOG_INF("RefreshLock user " << token.userId() << " filename [" << token.filename
                                << "] fileid " << request.fileId << " lock [" << lockId << ']');

    const LockResult result = _lockManager.refreshLock(token.filename, token.userId(), lockId, now);
    if (!result.success)
    {
        return lockConflict(result.currentLock, result.reason);
    }

    return WopiReply();
}

WopiReply WopiService::unlock(const WopiRequest& request, const AccessToken& token,
                              std::time_t now)
{
    const std::string lockId = requireHeader(request, "X-WOPI-Lock");
    LOG_INF("Unlock user " << token.userId() << " filename [" << token.filename << "] fileid "
                           << request.fileId << " lock [" << lockId << ']');

    const LockResult result = _lockManager.unlock(token.filename, token.userId(), lockId, now);
    if (!result.success)
    {
        return lockConflict(result.currentLock, result.reason);
    }

    return WopiReply();
}

WopiReply WopiService::getLock(const WopiRequest& request, const AccessToken& token,
                               std::time_t now)
{
    LOG_INF("GetLock user " << token.userId() << " filename [" << token.filename << "] fileid "
                            << request.fileId);

    WopiReply reply;
    reply.headers.set("X-WOPI-Lock", _lockManager.getLock(token.filename, token.userId(), now));
    return reply;
}

WopiReply WopiService::putFile(const WopiRequest& request, std::time_t now)
{
    const AccessToken token = authorize(request, now);
    requireEdit(token, "PutFile");

    const std::string& path = token.filename;
    const std::string userId = token.userId();
    const std::string lockId = request.getHeader("X-WOPI-Lock");
    LOG_INF("PutFile user " << userId << " filename [" << path << "] fileid " << request.fileId
                            << " lock [" << lockId << "] size " << request.body.size());

    auto guard = _lockManager.acquire();

    std::time_t lastWriteTime = 0;
    try
    {
        const std::string current = _lockManager.getLock(path, userId, now);
        if (!current.empty() && current != lockId)
        {
            return lockConflict(current, "Lock mismatch");
        }

        lastWriteTime = _lockManager.getLastWriteTime(path, userId);
    }
    catch (const FileNotFoundException&)
    {
        LOG_INF("File [" << path << "] was removed while open, forcing a conflict");
    }

    if (lastWriteTime == 0)
    {
        // Either the file was deleted or it was overwritten by others: save aside.
        const auto split = Util::splitExtension(path);
        const std::string conflictPath =
            split.first + "_conflict-" + Util::getCompactLocalTime(now) + split.second;
        _storage.writeFile(conflictPath, userId, request.body);
        LOG_INF("Conflicting copy created for user " << userId << " filename [" << conflictPath
                                                     << ']');

        WopiReply reply(HTTPResponse::HTTP_INTERNAL_SERVER_ERROR, "Conflicting copy created");
        reply.headers.set("X-WOPI-ServerError", "Conflicting copy created");
        return reply;
    }

    LOG_DBG("Got last WOPI save time " << lastWriteTime << " for [" << path << ']');

    // The check above and this write race with writers outside of WOPI.
    _storage.writeFile(path, userId, request.body);
    _lockManager.setLastWriteTime(path, userId, now);
    LOG_INF("File successfully written user " << userId << " filename [" << path << ']');

    const StorageBase::FileInfo info = _storage.stat(path, userId);
    WopiReply reply;
    reply.headers.set("X-WOPI-ItemVersion", std::to_string(info.getModifiedTime()));
    return reply;
}

WopiReply WopiService::putRelativeFile(const WopiRequest& request, const AccessToken& token,
                                       std::time_t now)
{
    const bool hasSuggested = request.headers.has("X-WOPI-SuggestedTarget");
    const bool hasRelative = request.headers.has("X-WOPI-RelativeTarget");
    if (hasSuggested == hasRelative)
    {
        throw BadRequestException(
            "Exactly one of X-WOPI-SuggestedTarget and X-WOPI-RelativeTarget is required");
    }

    const std::string userId = token.userId();
    const auto split = Util::splitPath(token.filename);
    const std::string& folder = split.first;

    auto guard = _lockManager.acquire();

    std::string name;
    if (hasSuggested)
    {
        const std::string suggested = request.getHeader("X-WOPI-SuggestedTarget");
        name = Util::startsWith(suggested, ".")
                   ? Util::splitExtension(split.second).first + suggested
                   : suggested;
        if (!isValidFileName(name))
        {
            throw BadRequestException("Invalid target name [" + suggested + ']');
        }

        const auto nameSplit = Util::splitExtension(name);
        name = findAvailableName(folder, nameSplit.first, nameSplit.second, userId);
    }
    else
    {
        name = request.getHeader("X-WOPI-RelativeTarget");
        if (!isValidFileName(name))
        {
            throw BadRequestException("Invalid target name [" + name + ']');
        }

        const std::string target = joinPath(folder, name);
        if (_storage.exists(target, userId))
        {
            const bool overwrite =
                Util::iequal(request.getHeader("X-WOPI-OverwriteRelativeTarget"), "true");
            if (!overwrite)
            {
                const auto nameSplit = Util::splitExtension(name);
                WopiReply reply(HTTPResponse::HTTP_CONFLICT, "Target file already exists");
                reply.headers.set("X-WOPI-ValidRelativeTarget",
                                  findAvailableName(folder, nameSplit.first, nameSplit.second,
                                                    userId));
                return reply;
            }

            const std::string current = _lockManager.getLock(target, userId, now);
            if (!current.empty())
            {
                return lockConflict(current, "Target file is locked");
            }
        }
    }

    const std::string path = joinPath(folder, name);
    LOG_INF("PutRelative user " << userId << " filename [" << token.filename << "] fileid "
                                << request.fileId << " target [" << path << ']');

    _storage.writeFile(path, userId, request.body);
    _lockManager.setLastWriteTime(path, userId, now);

    const StorageBase::FileInfo info = _storage.stat(path, userId);
    const std::string newToken = issueToken(token, path, info.getModifiedTime(), now);

    Poco::JSON::Object result;
    result.set("Name", name);
    result.set("Url", getWopiSrc(info.getFileId()) + "?access_token=" + newToken);
    return WopiReply(HTTPResponse::HTTP_OK, toJson(result), "application/json");
}

WopiReply WopiService::renameFile(const WopiRequest& request, const AccessToken& token,
                                  std::time_t now)
{
    const std::string requested = request.getHeader("X-WOPI-RequestedName");
    const std::string userId = token.userId();
    LOG_INF("RenameFile user " << userId << " filename [" << token.filename << "] fileid "
                               << request.fileId << " requested name [" << requested << ']');

    if (!isValidFileName(requested))
    {
        WopiReply reply(HTTPResponse::HTTP_BAD_REQUEST, "Invalid file name");
        reply.headers.set("X-WOPI-InvalidFileNameError", "Invalid file name");
        return reply;
    }

    auto guard = _lockManager.acquire();

    const std::string current = _lockManager.getLock(token.filename, userId, now);
    if (!current.empty() && current != request.getHeader("X-WOPI-Lock"))
    {
        return lockConflict(current, "Lock mismatch");
    }

    const auto split = Util::splitPath(token.filename);
    const std::string ext = Util::splitExtension(split.second).second;
    const std::string newPath = joinPath(split.first, requested + ext);
    if (newPath != token.filename)
    {
        if (_storage.exists(newPath, userId))
        {
            WopiReply reply(HTTPResponse::HTTP_BAD_REQUEST, "File already exists");
            reply.headers.set("X-WOPI-InvalidFileNameError", "File already exists");
            return reply;
        }

        _storage.renameFile(token.filename, newPath, userId);

        // Keep desktop applications informed that the renamed document is in use.
        if (!current.empty() && _config.isOfficeType(token.filename))
        {
            try
            {
                _storage.renameFile(WopiLock::getLibreOfficeLockPath(token.filename),
                                    WopiLock::getLibreOfficeLockPath(newPath), userId);
            }
            catch (const FileNotFoundException&)
            {
                LOG_DBG("No lock file to rename for [" << token.filename << ']');
            }
        }
    }

    Poco::JSON::Object result;
    result.set("Name", requested);
    return WopiReply(HTTPResponse::HTTP_OK, toJson(result), "application/json");
}

WopiReply WopiService::deleteFile(const WopiRequest& request, const AccessToken& token,
                                  std::time_t now)
{
    const std::string userId = token.userId();
    LOG_INF("DeleteFile user " << userId << " filename [" << token.filename << "] fileid "
                               << request.fileId);

    auto guard = _lockManager.acquire();

    const std::string current = _lockManager.getLock(token.filename, userId, now);
    if (!current.empty())
    {
        return lockConflict(current, "File is locked");
    }

    _storage.removeFile(token.filename, userId);
    return WopiReply();
}

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

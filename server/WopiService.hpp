/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

// The WOPI operations, independent of the HTTP transport.

#pragma once

#include <ctime>
#include <functional>
#include <map>
#include <ostream>
#include <string>

#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/NameValueCollection.h>

#include "Auth.hpp"
#include "WopiLock.hpp"

class StorageBase;
class WopiConfig;

/// An incoming WOPI call.
struct WopiRequest
{
    /// The <id> of /wopi/files/<id>, empty for other endpoints.
    std::string fileId;
    std::map<std::string, std::string> params;
    /// Case-insensitive.
    Poco::Net::NameValueCollection headers;
    std::string body;
    /// Numeric address of the peer.
    std::string clientAddress;

    /// Returns the query parameter or an empty string.
    std::string getParam(const std::string& name) const
    {
        const auto it = params.find(name);
        return it != params.end() ? it->second : std::string();
    }

    /// Returns the header or an empty string.
    std::string getHeader(const std::string& name) const { return headers.get(name, std::string()); }
};

/// The reply to a WOPI call.
struct WopiReply
{
    using BodyWriter = std::function<void(std::ostream&)>;

    explicit WopiReply(Poco::Net::HTTPResponse::HTTPStatus status = Poco::Net::HTTPResponse::HTTP_OK,
                       const std::string& body = "OK",
                       const std::string& contentType = "text/plain")
        : status(status)
        , body(body)
        , contentType(contentType)
    {
    }

    Poco::Net::HTTPResponse::HTTPStatus status;
    std::string body;
    std::string contentType;
    Poco::Net::NameValueCollection headers;
    /// When set, streams the body instead of sending body.
    BodyWriter bodyWriter;
};

/// Implements the WOPI endpoints on top of the configured storage.
/// Failures that map to an HTTP error are thrown as exceptions
/// (BadRequestException, UnauthorizedRequestException, FileNotFoundException, ...);
/// lock conflicts are replied with 409 directly.
class WopiService
{
public:
    WopiService(WopiConfig& config, StorageBase& storage, const std::string& wopiSecret,
                const std::string& iopSecret);

    /// The landing page.
    WopiReply index() const;

    /// Issues an access token for ruid, rgid, filename and canedit.
    /// With iop the caller authenticates with the shared secret as a Bearer
    /// token, otherwise its address must resolve from general.allowedclients.
    WopiReply open(const WopiRequest& request, bool iop, std::time_t now);

    WopiReply checkFileInfo(const WopiRequest& request, std::time_t now);

    WopiReply getFile(const WopiRequest& request, std::time_t now);

    /// POST /wopi/files/<id>: dispatches on X-WOPI-Override.
    WopiReply postFile(const WopiRequest& request, std::time_t now);

    WopiReply putFile(const WopiRequest& request, std::time_t now);

    LockManager& getLockManager() { return _lockManager; }

private:
    /// Verifies the access_token parameter.
    AccessToken authorize(const WopiRequest& request, std::time_t now) const;

    /// Throws unless the token allows modifications.
    static void requireEdit(const AccessToken& token, const std::string& operation);

    /// Returns true iff the client address matches one of general.allowedclients.
    bool isAllowedClient(const std::string& clientAddress) const;

    /// Returns the WOPISrc of a file id.
    std::string getWopiSrc(const std::string& fileId) const;

    /// Issues a token for path on behalf of the claims' user.
    std::string issueToken(const AccessToken& claims, const std::string& path, std::time_t mtime,
                           std::time_t now) const;

    WopiReply lock(const WopiRequest& request, const AccessToken& token, std::time_t now);
    WopiReply refreshLock(const WopiRequest& request, const AccessToken& token, std::time_t now);
    WopiReply unlock(const WopiRequest& request, const AccessToken& token, std::time_t now);
    WopiReply getLock(const WopiRequest& request, const AccessToken& token, std::time_t now);
    WopiReply putRelativeFile(const WopiRequest& request, const AccessToken& token,
                              std::time_t now);
    WopiReply renameFile(const WopiRequest& request, const AccessToken& token, std::time_t now);
    WopiReply deleteFile(const WopiRequest& request, const AccessToken& token, std::time_t now);

    /// Returns a name in folder that is not taken, starting from base + ext.
    std::string findAvailableName(const std::string& folder, const std::string& base,
                                  const std::string& ext, const std::string& userId);

    static WopiReply lockConflict(const std::string& currentLock, const std::string& reason);

private:
    WopiConfig& _config;
    StorageBase& _storage;
    const JWTAuth _auth;
    const std::string _iopSecret;
    LockManager _lockManager;
    /// Resolved once, the host name lookup is not free.
    const std::string _wopiUrl;
};

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

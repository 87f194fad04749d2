/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

// Access token support.

#pragma once

#include <ctime>
#include <string>

/// The claims carried by an access token.
struct AccessToken
{
    std::string ruid;
    std::string rgid;
    /// Path of the file relative to the storage root.
    std::string filename;
    bool canEdit = false;
    /// Modification time of the file when the token was issued.
    std::time_t mtime = 0;
    /// Expiry, in seconds since the epoch.
    std::time_t exp = 0;

    /// The user on whose behalf storage is accessed, as ruid:rgid.
    std::string userId() const { return ruid + ':' + rgid; }
};

/// JWT (HS256) signing and verification of access tokens with a shared secret.
class JWTAuth
{
public:
    explicit JWTAuth(const std::string& secret)
        : _secret(secret)
    {
    }

    /// Returns the compact serialization of a signed token with the given claims.
    std::string getAccessToken(const AccessToken& claims) const;

    /// Verifies the signature and the expiry of the token and returns its claims.
    /// Throws UnauthorizedRequestException when the token is not acceptable.
    AccessToken verify(const std::string& accessToken, std::time_t now) const;

    /// Base64url encoding without padding.
    static std::string base64UrlEncode(const std::string& data);

    /// Decodes base64url with or without padding.
    static std::string base64UrlDecode(const std::string& data);

private:
    std::string sign(const std::string& encodedBody) const;

private:
    const std::string _alg = "HS256";
    const std::string _typ = "JWT";

    const std::string _secret;
};

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include "Auth.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <Poco/Base64Decoder.h>
#include <Poco/Base64Encoder.h>
#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/LineEndingConverter.h>

#include <Exceptions.hpp>
#include <Log.hpp>
#include <Util.hpp>

using Poco::Base64Decoder;
using Poco::Base64Encoder;
using Poco::OutputLineEndingConverter;

std::string JWTAuth::base64UrlEncode(const std::string& data)
{
    // The encoder breaks lines, a line ending converter removes the CRLF.
    std::ostringstream ostr;
    OutputLineEndingConverter lineEndingConv(ostr, "");
    Base64Encoder encoder(lineEndingConv);
    encoder << data;
    encoder.close();
    std::string encoded = ostr.str();

    // trim '=' from end of encoded data
    encoded.erase(std::find_if(encoded.rbegin(), encoded.rend(),
                               [](char& ch)->bool { return ch != '='; }).base(), encoded.end());

    // Convert to a URL and filename safe variant:
    // Replace '+' with '-' && '/' with '_'
    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');

    return encoded;
}

std::string JWTAuth::base64UrlDecode(const std::string& data)
{
    std::string encoded = data;
    std::replace(encoded.begin(), encoded.end(), '-', '+');
    std::replace(encoded.begin(), encoded.end(), '_', '/');
    while (encoded.size() % 4 != 0)
        encoded += '=';

    std::istringstream istr(encoded);
    Base64Decoder decoder(istr);
    return std::string(std::istreambuf_iterator<char>(decoder), std::istreambuf_iterator<char>());
}

std::string JWTAuth::sign(const std::string& encodedBody) const
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (HMAC(EVP_sha256(), _secret.data(), static_cast<int>(_secret.size()),
             reinterpret_cast<const unsigned char*>(encodedBody.data()), encodedBody.size(),
             digest, &digestLen) == nullptr)
    {
        throw std::runtime_error("HMAC-SHA256 signing failed");
    }

    return base64UrlEncode(std::string(reinterpret_cast<const char*>(digest), digestLen));
}

std::string JWTAuth::getAccessToken(const AccessToken& claims) const
{
    Poco::JSON::Object header;
    header.set("alg", _alg);
    header.set("typ", _typ);

    Poco::JSON::Object payload;
    payload.set("ruid", claims.ruid);
    payload.set("rgid", claims.rgid);
    payload.set("filename", claims.filename);
    payload.set("canedit", claims.canEdit);
    payload.set("mtime", static_cast<Poco::Int64>(claims.mtime));
    payload.set("exp", static_cast<Poco::Int64>(claims.exp));

    std::ostringstream ossHeader;
    header.stringify(ossHeader);
    std::ostringstream ossPayload;
    payload.stringify(ossPayload);

    const std::string encodedBody =
        base64UrlEncode(ossHeader.str()) + '.' + base64UrlEncode(ossPayload.str());

    const std::string jwtToken = encodedBody + '.' + sign(encodedBody);
    LOG_DBG("JWT token generated: " << jwtToken << " for payload " << ossPayload.str());

    return jwtToken;
}

AccessToken JWTAuth::verify(const std::string& accessToken, std::time_t now) const
{
    const std::vector<std::string> tokens = Util::splitStringToVector(accessToken, '.');
    if (tokens.size() != 3 || std::count(accessToken.begin(), accessToken.end(), '.') != 2)
    {
        LOG_INF("JWTAuth: verification failed; Expected 3 segments in token ["
                << Log::abbreviate(accessToken) << ']');
        throw UnauthorizedRequestException("Invalid access token");
    }

    const std::string encodedBody = tokens[0] + '.' + tokens[1];
    const std::string encodedSig = sign(encodedBody);
    if (encodedSig.size() != tokens[2].size()
        || CRYPTO_memcmp(encodedSig.data(), tokens[2].data(), encodedSig.size()) != 0)
    {
        LOG_INF("JWTAuth: verification failed; signature mismatch for token ["
                << Log::abbreviate(accessToken) << ']');
        throw UnauthorizedRequestException("Invalid access token");
    }

    AccessToken claims;
    try
    {
        Poco::JSON::Parser headerParser;
        Poco::JSON::Object::Ptr header =
            headerParser.parse(base64UrlDecode(tokens[0])).extract<Poco::JSON::Object::Ptr>();
        if (!header || header->optValue<std::string>("alg", std::string()) != _alg)
        {
            LOG_INF("JWTAuth: verification failed; unexpected algorithm");
            throw UnauthorizedRequestException("Invalid access token");
        }

        const std::string decodedPayload = base64UrlDecode(tokens[1]);
        LOG_TRC("JWTAuth:verify: decoded payload: " << decodedPayload);

        Poco::JSON::Parser parser;
        Poco::JSON::Object::Ptr object =
            parser.parse(decodedPayload).extract<Poco::JSON::Object::Ptr>();
        for (const char* claim : { "ruid", "rgid", "filename", "canedit", "mtime", "exp" })
        {
            if (!object || !object->has(claim))
            {
                LOG_ERR("Invalid access token, missing " << claim << " field");
                throw UnauthorizedRequestException("Invalid access token");
            }
        }

        claims.ruid = object->get("ruid").convert<std::string>();
        claims.rgid = object->get("rgid").convert<std::string>();
        claims.filename = object->get("filename").convert<std::string>();
        claims.canEdit = object->get("canedit").convert<bool>();
        claims.mtime = static_cast<std::time_t>(object->get("mtime").convert<Poco::Int64>());
        claims.exp = static_cast<std::time_t>(object->get("exp").convert<Poco::Int64>());
    }
    catch (const Poco::Exception& exc)
    {
        LOG_WRN("JWTAuth:verify: Exception: " << exc.displayText());
        throw UnauthorizedRequestException("Invalid access token");
    }

    if (now > claims.exp)
    {
        LOG_INF("JWTAuth:verify: JWT expired; curtime:" << now << ", exp:" << claims.exp);
        throw UnauthorizedRequestException("Invalid access token");
    }

    return claims;
}

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

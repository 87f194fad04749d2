/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

// HTTP front of the WOPI service: routing and error mapping.

#pragma once

#include <ctime>
#include <string>

#include <Poco/Net/HTTPRequestHandler.h>
#include <Poco/Net/HTTPRequestHandlerFactory.h>
#include <Poco/Net/HTTPServerRequest.h>
#include <Poco/Net/HTTPServerResponse.h>

#include "WopiService.hpp"

class WopiConfig;

/// Handles one HTTP request by calling the matching WopiService operation.
class WopiRequestHandler : public Poco::Net::HTTPRequestHandler
{
public:
    WopiRequestHandler(WopiService& service, WopiConfig& config)
        : _service(service)
        , _config(config)
    {
    }

    void handleRequest(Poco::Net::HTTPServerRequest& request,
                       Poco::Net::HTTPServerResponse& response) override;

    /// Routes a parsed request. Exceptions are mapped to error replies.
    /// Exposed for testing without sockets.
    static WopiReply dispatch(WopiService& service, const WopiConfig& config,
                              const std::string& method, const std::string& uri,
                              WopiRequest& request, std::time_t now);

private:
    static void sendReply(Poco::Net::HTTPServerResponse& response, const WopiReply& reply);

private:
    WopiService& _service;
    WopiConfig& _config;
};

/// Creates a WopiRequestHandler for every incoming request.
class WopiRequestHandlerFactory : public Poco::Net::HTTPRequestHandlerFactory
{
public:
    WopiRequestHandlerFactory(WopiService& service, WopiConfig& config)
        : _service(service)
        , _config(config)
    {
    }

    Poco::Net::HTTPRequestHandler*
    createRequestHandler(const Poco::Net::HTTPServerRequest& request) override;

private:
    WopiService& _service;
    WopiConfig& _config;
};

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

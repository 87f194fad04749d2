/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include "RequestDispatcher.hpp"

#include <sstream>
#include <vector>

#include <Poco/Exception.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/StreamCopier.h>
#include <Poco/URI.h>

#include <Exceptions.hpp>
#include <Log.hpp>
#include <Util.hpp>

#include "WopiConfig.hpp"

using Poco::Net::HTTPRequest;
using Poco::Net::HTTPResponse;
using Poco::Net::HTTPServerRequest;
using Poco::Net::HTTPServerResponse;

namespace
{
WopiReply internalError(const WopiConfig& config, const std::string& what)
{
    LOG_ERR("Unexpected error while serving request: " << what);
    return WopiReply(HTTPResponse::HTTP_INTERNAL_SERVER_ERROR,
                     config.isDebug() ? "Internal error: " + what : "Internal error");
}
}

WopiReply WopiRequestHandler::dispatch(WopiService& service, const WopiConfig& config,
                                       const std::string& method, const std::string& uri,
                                       WopiRequest& request, std::time_t now)
{
    try
    {
        const Poco::URI requestUri(uri);
        std::vector<std::string> segs;
        requestUri.getPathSegments(segs);

        for (const auto& param : requestUri.getQueryParameters())
        {
            request.params[param.first] = param.second;
        }

        const bool isGet = method == HTTPRequest::HTTP_GET;
        const bool isPost = method == HTTPRequest::HTTP_POST;

        if (segs.empty() || (segs.size() == 1 && segs[0] == "wopi"))
        {
            if (isGet)
                return service.index();
        }
        else if ((segs.size() == 3 && segs[0] == "wopi" && segs[1] == "cbox" && segs[2] == "open")
                 || (segs.size() == 2 && segs[0] == "wopi" && segs[1] == "cboxopen"))
        {
            if (isGet)
                return service.open(request, false, now);
        }
        else if (segs.size() == 3 && segs[0] == "wopi" && segs[1] == "iop" && segs[2] == "open")
        {
            if (isGet)
                return service.open(request, true, now);
        }
        else if (segs.size() == 3 && segs[0] == "wopi" && segs[1] == "files")
        {
            request.fileId = segs[2];
            if (isGet)
                return service.checkFileInfo(request, now);
            if (isPost)
                return service.postFile(request, now);
        }
        else if (segs.size() == 4 && segs[0] == "wopi" && segs[1] == "files"
                 && segs[3] == "contents")
        {
            request.fileId = segs[2];
            if (isGet)
                return service.getFile(request, now);
            if (isPost)
                return service.putFile(request, now);
        }
        else
        {
            LOG_INF("No handler for " << method << ' ' << requestUri.getPath());
            return WopiReply(HTTPResponse::HTTP_NOT_FOUND, "Not found");
        }

        LOG_INF("Method " << method << " not allowed on " << requestUri.getPath());
        return WopiReply(HTTPResponse::HTTP_METHOD_NOT_ALLOWED, "Method not allowed");
    }
    catch (const BadRequestException& exc)
    {
        LOG_INF("Bad request " << method << ' ' << uri << ": " << exc.what());
        return WopiReply(HTTPResponse::HTTP_BAD_REQUEST, exc.what());
    }
    catch (const UnauthorizedRequestException& exc)
    {
        return WopiReply(HTTPResponse::HTTP_UNAUTHORIZED, exc.what());
    }
    catch (const FileNotFoundException& exc)
    {
        LOG_INF(exc.what());
        return WopiReply(HTTPResponse::HTTP_NOT_FOUND, "File not found");
    }
    catch (const IsADirectoryException& exc)
    {
        LOG_INF(exc.what());
        return WopiReply(HTTPResponse::HTTP_NOT_FOUND, "File not found");
    }
    catch (const Poco::Exception& exc)
    {
        return internalError(config, exc.displayText());
    }
    catch (const std::exception& exc)
    {
        return internalError(config, exc.what());
    }
}

void WopiRequestHandler::handleRequest(HTTPServerRequest& request, HTTPServerResponse& response)
{
    const std::time_t now = std::time(nullptr);
    _config.refresh(now);

    WopiRequest wopiRequest;
    wopiRequest.clientAddress = request.clientAddress().host().toString();
    for (const auto& it : request)
    {
        wopiRequest.headers.add(it.first, it.second);
    }

    if (request.getMethod() == HTTPRequest::HTTP_POST)
    {
        Poco::StreamCopier::copyToString(request.stream(), wopiRequest.body);
    }

    const WopiReply reply =
        dispatch(_service, _config, request.getMethod(), request.getURI(), wopiRequest, now);

    LOG_INF(request.getMethod() << ' ' << Poco::URI(request.getURI()).getPath() << " from "
                                << wopiRequest.clientAddress << ": " << static_cast<int>(reply.status));
    sendReply(response, reply);
}

void WopiRequestHandler::sendReply(HTTPServerResponse& response, const WopiReply& reply)
{
    response.setStatusAndReason(reply.status);
    for (const auto& it : reply.headers)
    {
        response.set(it.first, it.second);
    }

    response.setContentType(reply.contentType);

    if (reply.bodyWriter)
    {
        // The size is only known once the file is read.
        response.setChunkedTransferEncoding(true);
        std::ostream& os = response.send();
        try
        {
            reply.bodyWriter(os);
        }
        catch (const std::exception& exc)
        {
            // Headers are gone already, all we can do is cut the stream short.
            LOG_ERR("Failed to stream reply body: " << exc.what());
        }

        return;
    }

    response.setContentLength(reply.body.size());
    response.send() << reply.body;
}

Poco::Net::HTTPRequestHandler*
WopiRequestHandlerFactory::createRequestHandler(const HTTPServerRequest& request)
{
    Util::setThreadName("wopi_req_hdl");

    if (Log::traceEnabled() || _config.isDebug())
    {
        std::ostringstream oss;
        oss << "Request from " << request.clientAddress().toString() << ": "
            << request.getMethod() << ' ' << request.getURI() << ' ' << request.getVersion();
        for (const auto& it : request)
        {
            // Credentials and tokens stay out of the log.
            oss << " / " << it.first << ": "
                << (Util::iequal(it.first, "Authorization") ? "***" : it.second);
        }

        LOG_DBG(oss.str());
    }

    return new WopiRequestHandler(_service, _config);
}

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

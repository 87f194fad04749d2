/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include <map>
#include <memory>
#include <string>

#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPServer.h>
#include <Poco/Net/HTTPServerParams.h>
#include <Poco/Net/ServerSocket.h>
#include <Poco/Net/SocketAddress.h>
#include <Poco/StreamCopier.h>

#include <cppunit/extensions/HelperMacros.h>

#include <RequestDispatcher.hpp>
#include <Storage.hpp>
#include <WopiConfig.hpp>
#include <WopiService.hpp>

#include "helpers.hpp"

using Poco::Net::HTTPRequest;
using Poco::Net::HTTPResponse;

/// End-to-end tests over a loopback HTTP server.
class HttpServerTests : public CPPUNIT_NS::TestFixture
{
    CPPUNIT_TEST_SUITE(HttpServerTests);

    CPPUNIT_TEST(testIndex);
    CPPUNIT_TEST(testUnknownPath);
    CPPUNIT_TEST(testMethodNotAllowed);
    CPPUNIT_TEST(testInvalidToken);
    CPPUNIT_TEST(testOpenAndGetFile);
    CPPUNIT_TEST(testMissingOverride);
    CPPUNIT_TEST(testLockAndSave);

    CPPUNIT_TEST_SUITE_END();

    void testIndex();
    void testUnknownPath();
    void testMethodNotAllowed();
    void testInvalidToken();
    void testOpenAndGetFile();
    void testMissingOverride();
    void testLockAndSave();

public:
    void setUp() override
    {
        _dir.reset(new helpers::TempDir());
        _config.reset(new WopiConfig());
        _config->load(helpers::getDefaultsFile(), std::string(),
                      { { "local.storagehomepath", _dir->path() },
                        { "general.wopiurl", "http://wopi.example.org" },
                        { "general.allowedclients", "127.0.0.1" } });
        _storage = StorageBase::create(*_config);
        _service.reset(new WopiService(*_config, *_storage, "wopi secret", "iop secret"));

        helpers::writeFile(*_dir / "doc.docx", "document content");

        Poco::Net::ServerSocket socket(Poco::Net::SocketAddress("127.0.0.1", 0));
        _port = socket.address().port();

        Poco::Net::HTTPServerParams::Ptr params = new Poco::Net::HTTPServerParams();
        params->setMaxThreads(4);
        _server.reset(new Poco::Net::HTTPServer(new WopiRequestHandlerFactory(*_service, *_config),
                                                socket, params));
        _server->start();
    }

    void tearDown() override
    {
        _server->stopAll(true);
        _server.reset();
        _service.reset();
        _storage.reset();
        _config.reset();
        _dir.reset();
    }

private:
    /// Sends a request and returns the response body.
    std::string request(const std::string& method, const std::string& uri,
                        HTTPResponse& response,
                        const std::map<std::string, std::string>& headers = {},
                        const std::string& body = std::string())
    {
        Poco::Net::HTTPClientSession session("127.0.0.1", _port);
        HTTPRequest req(method, uri, Poco::Net::HTTPMessage::HTTP_1_1);
        for (const auto& pair : headers)
        {
            req.set(pair.first, pair.second);
        }

        if (method == HTTPRequest::HTTP_POST)
        {
            req.setContentLength(body.size());
        }

        session.sendRequest(req) << body;

        std::string result;
        Poco::StreamCopier::copyToString(session.receiveResponse(response), result);
        return result;
    }

    /// Opens /doc.docx through the cbox endpoint, returns the access token.
    std::string openDocument()
    {
        HTTPResponse response;
        const std::string body = request(
            HTTPRequest::HTTP_GET,
            "/wopi/cbox/open?ruid=1000&rgid=100&filename=%2Fdoc.docx&canedit=yes", response);
        CPPUNIT_ASSERT_EQUAL_MESSAGE(body, HTTPResponse::HTTP_OK, response.getStatus());

        const std::string marker = "&access_token=";
        CPPUNIT_ASSERT_MESSAGE(body, body.find(marker) != std::string::npos);
        return body.substr(body.find(marker) + marker.size());
    }

    std::string filesUri(const std::string& suffix, const std::string& token) const
    {
        return "/wopi/files/" + _storage->stat("/doc.docx", "1000:100").getFileId() + suffix
               + "?access_token=" + token;
    }

    std::unique_ptr<helpers::TempDir> _dir;
    std::unique_ptr<WopiConfig> _config;
    std::unique_ptr<StorageBase> _storage;
    std::unique_ptr<WopiService> _service;
    std::unique_ptr<Poco::Net::HTTPServer> _server;
    Poco::UInt16 _port = 0;
};

void HttpServerTests::testIndex()
{
    for (const char* uri : { "/", "/wopi" })
    {
        HTTPResponse response;
        const std::string body = request(HTTPRequest::HTTP_GET, uri, response);
        CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_OK, response.getStatus());
        CPPUNIT_ASSERT_EQUAL(std::string("text/html"), response.getContentType());
        CPPUNIT_ASSERT(body.find("WOPI Server") != std::string::npos);
    }
}

void HttpServerTests::testUnknownPath()
{
    HTTPResponse response;
    const std::string body = request(HTTPRequest::HTTP_GET, "/wopi/nothing/here", response);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_NOT_FOUND, response.getStatus());
    CPPUNIT_ASSERT_EQUAL(std::string("Not found"), body);
}

void HttpServerTests::testMethodNotAllowed()
{
    HTTPResponse response;
    request(HTTPRequest::HTTP_POST, "/wopi/cbox/open", response);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_METHOD_NOT_ALLOWED, response.getStatus());

    request(HTTPRequest::HTTP_DELETE, "/wopi/files/1", response);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_METHOD_NOT_ALLOWED, response.getStatus());
}

void HttpServerTests::testInvalidToken()
{
    HTTPResponse response;
    std::string body = request(HTTPRequest::HTTP_GET, "/wopi/files/1?access_token=bogus", response);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_UNAUTHORIZED, response.getStatus());
    CPPUNIT_ASSERT_EQUAL(std::string("Invalid access token"), body);

    body = request(HTTPRequest::HTTP_GET, "/wopi/files/1/contents", response);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_UNAUTHORIZED, response.getStatus());
}

void HttpServerTests::testOpenAndGetFile()
{
    const std::string token = openDocument();

    HTTPResponse response;
    std::string body = request(HTTPRequest::HTTP_GET, filesUri(std::string(), token), response);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_OK, response.getStatus());
    CPPUNIT_ASSERT_EQUAL(std::string("application/json"), response.getContentType());
    CPPUNIT_ASSERT(body.find("\"BaseFileName\":\"doc.docx\"") != std::string::npos);

    body = request(HTTPRequest::HTTP_GET, filesUri("/contents", token), response);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_OK, response.getStatus());
    CPPUNIT_ASSERT_EQUAL(std::string("document content"), body);
    CPPUNIT_ASSERT(response.has("X-WOPI-ItemVersion"));

    // Gone after being opened.
    FileUtil::removeFile(*_dir / "doc.docx");
    body = request(HTTPRequest::HTTP_GET,
                   "/wopi/files/1/contents?access_token=" + token, response);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_NOT_FOUND, response.getStatus());
    CPPUNIT_ASSERT_EQUAL(std::string("File not found"), body);
}

void HttpServerTests::testMissingOverride()
{
    const std::string token = openDocument();

    HTTPResponse response;
    const std::string body = request(HTTPRequest::HTTP_POST, filesUri(std::string(), token),
                                     response);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_BAD_REQUEST, response.getStatus());
    CPPUNIT_ASSERT_EQUAL(std::string("Missing header X-WOPI-Override in POST request"), body);
}

void HttpServerTests::testLockAndSave()
{
    helpers::requireXattrSupport(_dir->path());

    const std::string token = openDocument();

    HTTPResponse response;
    request(HTTPRequest::HTTP_POST, filesUri(std::string(), token), response,
            { { "X-WOPI-Override", "LOCK" }, { "X-WOPI-Lock", "http-lock" } });
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_OK, response.getStatus());

    request(HTTPRequest::HTTP_POST, filesUri(std::string(), token), response,
            { { "X-WOPI-Override", "GET_LOCK" } });
    CPPUNIT_ASSERT_EQUAL(std::string("http-lock"), response.get("X-WOPI-Lock"));

    std::string body = request(HTTPRequest::HTTP_POST, filesUri("/contents", token), response,
                               { { "X-WOPI-Lock", "other-lock" } }, "overwritten");
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_CONFLICT, response.getStatus());
    CPPUNIT_ASSERT_EQUAL(std::string("http-lock"), response.get("X-WOPI-Lock"));

    body = request(HTTPRequest::HTTP_POST, filesUri("/contents", token), response,
                   { { "X-WOPI-Lock", "http-lock" } }, "new content");
    CPPUNIT_ASSERT_EQUAL_MESSAGE(body, HTTPResponse::HTTP_OK, response.getStatus());
    CPPUNIT_ASSERT_EQUAL(std::string("new content"), helpers::readFile(*_dir / "doc.docx"));
}

CPPUNIT_TEST_SUITE_REGISTRATION(HttpServerTests);

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

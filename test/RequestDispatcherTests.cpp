/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include <memory>
#include <stdexcept>
#include <string>

#include <Poco/Exception.h>
#include <Poco/Net/HTTPRequest.h>

#include <cppunit/extensions/HelperMacros.h>

#include <Exceptions.hpp>
#include <RequestDispatcher.hpp>
#include <Storage.hpp>
#include <WopiConfig.hpp>
#include <WopiService.hpp>

#include "helpers.hpp"

using Poco::Net::HTTPRequest;
using Poco::Net::HTTPResponse;

namespace
{
const std::time_t Now = 1600000000;

/// Local storage whose stat() can be switched to fail with a given error.
class FailingStorage : public LocalStorage
{
public:
    enum class Failure
    {
        None,
        Storage,
        NotFound,
        Poco,
        Runtime
    };

    explicit FailingStorage(const std::string& homePath)
        : LocalStorage(homePath)
        , _failure(Failure::None)
    {
    }

    void setFailure(Failure failure) { _failure = failure; }

    FileInfo stat(const std::string& path, const std::string& userId) override
    {
        switch (_failure)
        {
            case Failure::None:
                break;
            case Failure::Storage:
                throw StorageException("stat failed for [" + path + "]: Input/output error");
            case Failure::NotFound:
                throw FileNotFoundException("stat failed for [" + path
                                            + "]: No such file or directory");
            case Failure::Poco:
                throw Poco::IOException("disk unplugged");
            case Failure::Runtime:
                throw std::runtime_error("out of handles");
        }

        return LocalStorage::stat(path, userId);
    }

private:
    Failure _failure;
};
}

/// Request routing and error mapping unit-tests.
class RequestDispatcherTests : public CPPUNIT_NS::TestFixture
{
    CPPUNIT_TEST_SUITE(RequestDispatcherTests);

    CPPUNIT_TEST(testRouting);
    CPPUNIT_TEST(testFileNotFound);
    CPPUNIT_TEST(testStorageError);
    CPPUNIT_TEST(testUnexpectedErrors);
    CPPUNIT_TEST(testErrorDetailsInDebug);

    CPPUNIT_TEST_SUITE_END();

    void testRouting();
    void testFileNotFound();
    void testStorageError();
    void testUnexpectedErrors();
    void testErrorDetailsInDebug();

public:
    void setUp() override
    {
        _dir.reset(new helpers::TempDir());
        helpers::writeFile(*_dir / "doc.docx", "document content");
        load("Info");
    }

    void tearDown() override
    {
        _service.reset();
        _storage.reset();
        _config.reset();
        _dir.reset();
    }

private:
    void load(const std::string& logLevel)
    {
        _service.reset();
        _storage.reset();
        _config.reset(new WopiConfig());
        _config->load(helpers::getDefaultsFile(), std::string(),
                      { { "local.storagehomepath", _dir->path() },
                        { "general.wopiurl", "http://wopi.example.org" },
                        { "general.allowedclients", "127.0.0.1" },
                        { "general.loglevel", logLevel } });
        _storage.reset(new FailingStorage(_dir->path()));
        _service.reset(new WopiService(*_config, *_storage, "wopi secret", "iop secret"));
    }

    WopiReply dispatch(const std::string& method, const std::string& uri)
    {
        WopiRequest request;
        request.clientAddress = "127.0.0.1";
        return WopiRequestHandler::dispatch(*_service, *_config, method, uri, request, Now);
    }

    /// Opens /doc.docx and returns the CheckFileInfo URI for it.
    std::string openDocument()
    {
        const WopiReply reply = dispatch(
            HTTPRequest::HTTP_GET, "/wopi/cbox/open?ruid=1000&rgid=100&filename=%2Fdoc.docx");
        CPPUNIT_ASSERT_EQUAL_MESSAGE(reply.body, HTTPResponse::HTTP_OK, reply.status);

        const std::string marker = "&access_token=";
        const std::size_t pos = reply.body.find(marker);
        CPPUNIT_ASSERT_MESSAGE(reply.body, pos != std::string::npos);
        return "/wopi/files/1?access_token=" + reply.body.substr(pos + marker.size());
    }

    std::unique_ptr<helpers::TempDir> _dir;
    std::unique_ptr<WopiConfig> _config;
    std::unique_ptr<FailingStorage> _storage;
    std::unique_ptr<WopiService> _service;
};

void RequestDispatcherTests::testRouting()
{
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_OK, dispatch(HTTPRequest::HTTP_GET, "/").status);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_OK, dispatch(HTTPRequest::HTTP_GET, "/wopi").status);

    WopiReply reply = dispatch(HTTPRequest::HTTP_GET, "/wopi/files");
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_NOT_FOUND, reply.status);
    CPPUNIT_ASSERT_EQUAL(std::string("Not found"), reply.body);

    reply = dispatch(HTTPRequest::HTTP_PUT, "/wopi/files/1/contents");
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_METHOD_NOT_ALLOWED, reply.status);

    reply = dispatch(HTTPRequest::HTTP_GET, "/wopi/cbox/open?ruid=1000&rgid=100");
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_BAD_REQUEST, reply.status);

    reply = dispatch(HTTPRequest::HTTP_GET, "/wopi/files/1/contents?access_token=bogus");
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_UNAUTHORIZED, reply.status);
}

void RequestDispatcherTests::testFileNotFound()
{
    const std::string uri = openDocument();

    _storage->setFailure(FailingStorage::Failure::NotFound);
    const WopiReply reply = dispatch(HTTPRequest::HTTP_GET, uri);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_NOT_FOUND, reply.status);
    CPPUNIT_ASSERT_EQUAL(std::string("File not found"), reply.body);
}

void RequestDispatcherTests::testStorageError()
{
    const std::string uri = openDocument();

    _storage->setFailure(FailingStorage::Failure::Storage);
    const WopiReply reply = dispatch(HTTPRequest::HTTP_GET, uri);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_INTERNAL_SERVER_ERROR, reply.status);
    CPPUNIT_ASSERT_EQUAL(std::string("Internal error"), reply.body);

    // Back to normal once the storage recovers.
    _storage->setFailure(FailingStorage::Failure::None);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_OK, dispatch(HTTPRequest::HTTP_GET, uri).status);
}

void RequestDispatcherTests::testUnexpectedErrors()
{
    const std::string uri = openDocument();

    _storage->setFailure(FailingStorage::Failure::Poco);
    WopiReply reply = dispatch(HTTPRequest::HTTP_GET, uri);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_INTERNAL_SERVER_ERROR, reply.status);
    CPPUNIT_ASSERT_EQUAL(std::string("Internal error"), reply.body);

    _storage->setFailure(FailingStorage::Failure::Runtime);
    reply = dispatch(HTTPRequest::HTTP_GET, uri);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_INTERNAL_SERVER_ERROR, reply.status);
    CPPUNIT_ASSERT_EQUAL(std::string("Internal error"), reply.body);
}

void RequestDispatcherTests::testErrorDetailsInDebug()
{
    load("Debug");
    CPPUNIT_ASSERT(_config->isDebug());
    const std::string uri = openDocument();

    _storage->setFailure(FailingStorage::Failure::Storage);
    WopiReply reply = dispatch(HTTPRequest::HTTP_GET, uri);
    CPPUNIT_ASSERT_EQUAL(HTTPResponse::HTTP_INTERNAL_SERVER_ERROR, reply.status);
    CPPUNIT_ASSERT_EQUAL(
        std::string("Internal error: stat failed for [/doc.docx]: Input/output error"),
        reply.body);

    _storage->setFailure(FailingStorage::Failure::Poco);
    reply = dispatch(HTTPRequest::HTTP_GET, uri);
    CPPUNIT_ASSERT_EQUAL(std::string("Internal error: I/O error: disk unplugged"), reply.body);

    _storage->setFailure(FailingStorage::Failure::Runtime);
    reply = dispatch(HTTPRequest::HTTP_GET, uri);
    CPPUNIT_ASSERT_EQUAL(std::string("Internal error: out of handles"), reply.body);

    // Not-found replies never carry details.
    _storage->setFailure(FailingStorage::Failure::NotFound);
    reply = dispatch(HTTPRequest::HTTP_GET, uri);
    CPPUNIT_ASSERT_EQUAL(std::string("File not found"), reply.body);
}

CPPUNIT_TEST_SUITE_REGISTRATION(RequestDispatcherTests);

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

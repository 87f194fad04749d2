/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <vector>

#include <Poco/File.h>

#include <cppunit/extensions/HelperMacros.h>

#include <Exceptions.hpp>
#include <Storage.hpp>
#include <WopiConfig.hpp>

#include "helpers.hpp"

namespace
{
const std::string User = "1000:100";
}

/// Local storage unit-tests.
class StorageTests : public CPPUNIT_NS::TestFixture
{
    CPPUNIT_TEST_SUITE(StorageTests);

    CPPUNIT_TEST(testCreate);
    CPPUNIT_TEST(testStat);
    CPPUNIT_TEST(testPathTraversal);
    CPPUNIT_TEST(testReadChunks);
    CPPUNIT_TEST(testWriteFile);
    CPPUNIT_TEST(testExclusiveWrite);
    CPPUNIT_TEST(testXattrs);
    CPPUNIT_TEST(testRenameAndRemove);

    CPPUNIT_TEST_SUITE_END();

    void testCreate();
    void testStat();
    void testPathTraversal();
    void testReadChunks();
    void testWriteFile();
    void testExclusiveWrite();
    void testXattrs();
    void testRenameAndRemove();
};

void StorageTests::testCreate()
{
    helpers::TempDir dir;

    WopiConfig config;
    config.load(helpers::getDefaultsFile(), std::string(),
                { { "local.storagehomepath", dir.path() + '/' } });
    std::unique_ptr<StorageBase> storage = StorageBase::create(config);
    CPPUNIT_ASSERT(dynamic_cast<LocalStorage*>(storage.get()) != nullptr);

    WopiConfig xroot;
    xroot.load(helpers::getDefaultsFile(), std::string(),
               { { "general.storagetype", "xroot" }, { "local.storagehomepath", dir.path() } });
    CPPUNIT_ASSERT_THROW(StorageBase::create(xroot), ConfigException);

    WopiConfig unknown;
    unknown.load(helpers::getDefaultsFile(), std::string(),
                 { { "general.storagetype", "s3" }, { "local.storagehomepath", dir.path() } });
    CPPUNIT_ASSERT_THROW(StorageBase::create(unknown), ConfigException);

    CPPUNIT_ASSERT_THROW(LocalStorage(dir / "missing"), ConfigException);
    helpers::writeFile(dir / "file", "x");
    CPPUNIT_ASSERT_THROW(LocalStorage(dir / "file"), ConfigException);
}

void StorageTests::testStat()
{
    helpers::TempDir dir;
    Poco::File(dir / "docs").createDirectory();
    helpers::writeFile(dir / "docs/report.docx", "0123456789");

    LocalStorage storage(dir.path());
    const StorageBase::FileInfo info = storage.stat("/docs/report.docx", User);

    const FileUtil::Stat st(dir / "docs/report.docx");
    CPPUNIT_ASSERT_EQUAL(std::to_string(st.inodeNumber()), info.getFileId());
    CPPUNIT_ASSERT_EQUAL(std::string("/docs/report.docx"), info.getPath());
    CPPUNIT_ASSERT_EQUAL(std::to_string(::getuid()) + ':' + std::to_string(::getgid()),
                         info.getOwnerId());
    CPPUNIT_ASSERT_EQUAL(static_cast<std::size_t>(10), info.getSize());
    CPPUNIT_ASSERT_EQUAL(st.modifiedTime(), info.getModifiedTime());

    // Relative and absolute paths name the same file.
    CPPUNIT_ASSERT_EQUAL(info.getFileId(), storage.stat("docs/report.docx", User).getFileId());

    CPPUNIT_ASSERT_THROW(storage.stat("/docs/missing.docx", User), FileNotFoundException);
    CPPUNIT_ASSERT_THROW(storage.stat("/nodir/missing.docx", User), FileNotFoundException);
    CPPUNIT_ASSERT_THROW(storage.stat("/docs/report.docx/sub", User), FileNotFoundException);
    CPPUNIT_ASSERT_THROW(storage.stat("/docs", User), IsADirectoryException);

    CPPUNIT_ASSERT(storage.exists("/docs/report.docx", User));
    CPPUNIT_ASSERT(storage.exists("/docs", User));
    CPPUNIT_ASSERT(!storage.exists("/docs/missing.docx", User));
}

void StorageTests::testPathTraversal()
{
    helpers::TempDir dir;
    Poco::File(dir / "root").createDirectory();
    helpers::writeFile(dir / "outside.txt", "secret");

    LocalStorage storage(dir / "root");
    CPPUNIT_ASSERT_THROW(storage.stat("../outside.txt", User), BadRequestException);
    CPPUNIT_ASSERT_THROW(storage.stat("/a/../../outside.txt", User), BadRequestException);
    CPPUNIT_ASSERT_THROW(storage.writeFile("/../x", User, "x"), BadRequestException);
    CPPUNIT_ASSERT_THROW(storage.stat(std::string("a\0b", 3), User), BadRequestException);

    // Dots within names are fine.
    helpers::writeFile(dir / "root/..hidden", "h");
    CPPUNIT_ASSERT_NO_THROW(storage.stat("/..hidden", User));
}

void StorageTests::testReadChunks()
{
    helpers::TempDir dir;
    const std::string content = "abcdefghijklmnopqrstuvwxyz";
    helpers::writeFile(dir / "alphabet.txt", content);

    LocalStorage storage(dir.path());
    std::vector<std::string> chunks;
    storage.readFile("/alphabet.txt", User, 10,
                     [&chunks](const char* data, std::size_t size)
                     { chunks.emplace_back(data, size); });

    CPPUNIT_ASSERT_EQUAL(static_cast<std::size_t>(3), chunks.size());
    CPPUNIT_ASSERT_EQUAL(std::string("abcdefghij"), chunks[0]);
    CPPUNIT_ASSERT_EQUAL(std::string("klmnopqrst"), chunks[1]);
    CPPUNIT_ASSERT_EQUAL(std::string("uvwxyz"), chunks[2]);

    // An empty file yields no chunk.
    helpers::writeFile(dir / "empty.txt", std::string());
    chunks.clear();
    storage.readFile("/empty.txt", User, 10,
                     [&chunks](const char* data, std::size_t size)
                     { chunks.emplace_back(data, size); });
    CPPUNIT_ASSERT(chunks.empty());

    CPPUNIT_ASSERT_THROW(storage.readFile("/missing.txt", User, 10,
                                          [](const char*, std::size_t) {}),
                         FileNotFoundException);
}

void StorageTests::testWriteFile()
{
    helpers::TempDir dir;
    LocalStorage storage(dir.path());

    storage.writeFile("/new.odt", User, "first version, long");
    CPPUNIT_ASSERT_EQUAL(std::string("first version, long"), helpers::readFile(dir / "new.odt"));

    // Overwriting truncates in place.
    const std::string fileId = storage.stat("/new.odt", User).getFileId();
    storage.writeFile("/new.odt", User, "second");
    CPPUNIT_ASSERT_EQUAL(std::string("second"), helpers::readFile(dir / "new.odt"));
    CPPUNIT_ASSERT_EQUAL(fileId, storage.stat("/new.odt", User).getFileId());

    storage.writeFile("/empty.odt", User, std::string());
    CPPUNIT_ASSERT_EQUAL(static_cast<std::size_t>(0), storage.stat("/empty.odt", User).getSize());

    CPPUNIT_ASSERT_THROW(storage.writeFile("/nodir/new.odt", User, "x"), FileNotFoundException);
}

void StorageTests::testExclusiveWrite()
{
    helpers::TempDir dir;
    LocalStorage storage(dir.path());

    storage.writeFile("/.~lock.doc.docx#", User, "mine", /*isLock=*/true);
    CPPUNIT_ASSERT_EQUAL(std::string("mine"), helpers::readFile(dir / ".~lock.doc.docx#"));

    CPPUNIT_ASSERT_THROW(storage.writeFile("/.~lock.doc.docx#", User, "theirs", true),
                         FileExistsException);
    CPPUNIT_ASSERT_EQUAL(std::string("mine"), helpers::readFile(dir / ".~lock.doc.docx#"));
}

void StorageTests::testXattrs()
{
    helpers::TempDir dir;
    helpers::requireXattrSupport(dir.path());

    helpers::writeFile(dir / "doc.docx", "x");
    LocalStorage storage(dir.path());

    CPPUNIT_ASSERT_EQUAL(std::string(), storage.getXattr("/doc.docx", User, "oc.wopi.lock"));

    storage.setXattr("/doc.docx", User, "oc.wopi.lock", "{\"wopilock\":\"L\",\"exp\":1}");
    CPPUNIT_ASSERT_EQUAL(std::string("{\"wopilock\":\"L\",\"exp\":1}"),
                         storage.getXattr("/doc.docx", User, "oc.wopi.lock"));

    storage.setXattr("/doc.docx", User, "oc.wopi.lock", "2");
    CPPUNIT_ASSERT_EQUAL(std::string("2"), storage.getXattr("/doc.docx", User, "oc.wopi.lock"));

    storage.rmXattr("/doc.docx", User, "oc.wopi.lock");
    CPPUNIT_ASSERT_EQUAL(std::string(), storage.getXattr("/doc.docx", User, "oc.wopi.lock"));

    // Removing twice is harmless.
    CPPUNIT_ASSERT_NO_THROW(storage.rmXattr("/doc.docx", User, "oc.wopi.lock"));

    CPPUNIT_ASSERT_THROW(storage.getXattr("/missing.docx", User, "oc.wopi.lock"),
                         FileNotFoundException);
    CPPUNIT_ASSERT_THROW(storage.setXattr("/missing.docx", User, "oc.wopi.lock", "x"),
                         FileNotFoundException);
}

void StorageTests::testRenameAndRemove()
{
    helpers::TempDir dir;
    helpers::writeFile(dir / "a.docx", "content");
    LocalStorage storage(dir.path());

    const std::string fileId = storage.stat("/a.docx", User).getFileId();
    storage.renameFile("/a.docx", "/b.docx", User);
    CPPUNIT_ASSERT(!helpers::fileExists(dir / "a.docx"));
    CPPUNIT_ASSERT_EQUAL(std::string("content"), helpers::readFile(dir / "b.docx"));
    CPPUNIT_ASSERT_EQUAL(fileId, storage.stat("/b.docx", User).getFileId());

    CPPUNIT_ASSERT_THROW(storage.renameFile("/a.docx", "/c.docx", User), FileNotFoundException);

    storage.removeFile("/b.docx", User);
    CPPUNIT_ASSERT(!helpers::fileExists(dir / "b.docx"));
    CPPUNIT_ASSERT_THROW(storage.removeFile("/b.docx", User), FileNotFoundException);
}

CPPUNIT_TEST_SUITE_REGISTRATION(StorageTests);

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

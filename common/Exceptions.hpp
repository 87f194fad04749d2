/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

// Exception classes to differentiate between the
// different error situations and handling.

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

// not beautiful
#define EXCEPTION_DECL(type,parent_cl)  \
    class type : public parent_cl \
    { \
    public: \
        type(const std::string &str) : parent_cl(str) {} \
    };

// Generic WOPI server errors and base for others.
class WopiException : public std::runtime_error
{
protected:
    using std::runtime_error::runtime_error;
};

/// A bad-request exception that is meant to signify,
/// and translate into, an HTTP bad request.
EXCEPTION_DECL(BadRequestException,WopiException)

/// An authorization exception that is meant to signify,
/// and translate into, an HTTP unauthorized error.
EXCEPTION_DECL(UnauthorizedRequestException,WopiException)

/// Invalid or missing configuration. Fatal at startup.
EXCEPTION_DECL(ConfigException,WopiException)

/// General storage backend failure.
EXCEPTION_DECL(StorageException,WopiException)

/// The file does not exist, translates into HTTP not found.
EXCEPTION_DECL(FileNotFoundException,StorageException)

/// A directory was given where a file is expected.
EXCEPTION_DECL(IsADirectoryException,StorageException)

/// An exclusive creation found the file already present.
EXCEPTION_DECL(FileExistsException,StorageException)

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */

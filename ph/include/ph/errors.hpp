/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#pragma once
#include <stdexcept>
#include <string>

namespace ph {

// Failure to obtain the TLS identity from the PKCS#12 bundle.
class IdentityError : public std::runtime_error {
public:
    enum class Kind { NotFound, DecodeError };

    IdentityError(Kind kind, const std::string& what)
        : std::runtime_error(what), _kind(kind) {}

    Kind kind() const { return _kind; }

private:
    Kind _kind;
};

// socket/bind/listen failures (port in use, permission denied, ...)
class ListenerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// SSL_CTX could not be built from a loaded identity.
class TlsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ph

/**
 *    Copyright (C) 2018-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#pragma once

#include <exception>
#include <string>

#include "dualbson/base/status.h"
#include "dualbson/base/status_with.h"
#include "dualbson/platform/compiler.h"

namespace dualbson {

/**
 * Most dualbson exceptions inherit from this. It carries a Status so that the public, non-throwing
 * entry points can hand the failure back to their caller unchanged.
 */
class DBException : public std::exception {
public:
    const char* what() const noexcept override {
        return reason().c_str();
    }

    virtual void addContext(StringData context) {
        _status.addContext(context);
    }

    Status toStatus(StringData context) const {
        return _status.withContext(context);
    }
    Status toStatus() const {
        return _status;
    }

    ErrorCodes::Error code() const {
        return _status.code();
    }

    const std::string& reason() const {
        return _status.reason();
    }

    std::string codeString() const {
        return _status.codeString();
    }

    std::string toString() const {
        return _status.toString();
    }

    /** Returns true if this exception's code is a member of the given category. */
    template <ErrorCategory category>
    bool isA() const {
        return ErrorCodes::isA<category>(code());
    }

protected:
    DBException(const Status& status);

private:
    Status _status;
};

class AssertionException : public DBException {
public:
    AssertionException(const Status& status) : DBException(status) {}
};

DUALBSON_COMPILER_NORETURN void uassertedWithLocation(const Status& status,
                                                      const char* file,
                                                      unsigned line);

DUALBSON_COMPILER_NORETURN inline void uassertedWithLocation(ErrorCodes::Error code,
                                                             const std::string& msg,
                                                             const char* file,
                                                             unsigned line) {
    uassertedWithLocation(Status(code, msg), file, line);
}

DUALBSON_COMPILER_NORETURN void invariantFailed(const char* expr,
                                                const char* file,
                                                unsigned line) noexcept;

/**
 * "user assert".  if asserts, user did something wrong, not our code.
 *
 * Using an immediately invoked lambda to give the compiler an easy way to inline the check (expr)
 * and out-of-line the error path. This is most helpful when the error path involves building a
 * complex error message in the expansion of msg. The call to the lambda is followed by
 * DUALBSON_COMPILER_UNREACHABLE as it is impossible to mark a lambda noreturn.
 */
#define uassert DUALBSON_uassert
#define DUALBSON_uassert(code, msg, expr)                                          \
    do {                                                                           \
        if (DUALBSON_unlikely(!(expr))) {                                          \
            [&]() DUALBSON_COMPILER_COLD_FUNCTION {                                \
                ::dualbson::uassertedWithLocation(code, msg, __FILE__, __LINE__);  \
            }();                                                                   \
            DUALBSON_COMPILER_UNREACHABLE;                                         \
        }                                                                          \
    } while (false)

#define uasserted DUALBSON_uasserted
#define DUALBSON_uasserted(...) ::dualbson::uassertedWithLocation(__VA_ARGS__, __FILE__, __LINE__)

#define uassertStatusOK DUALBSON_uassertStatusOK
#define DUALBSON_uassertStatusOK(...) \
    ::dualbson::uassertStatusOKWithLocation(__VA_ARGS__, __FILE__, __LINE__)
inline void uassertStatusOKWithLocation(const Status& status, const char* file, unsigned line) {
    if (DUALBSON_unlikely(!status.isOK())) {
        uassertedWithLocation(status, file, line);
    }
}

template <typename T>
inline T uassertStatusOKWithLocation(StatusWith<T> sw, const char* file, unsigned line) {
    uassertStatusOKWithLocation(sw.getStatus(), file, line);
    return std::move(sw.getValue());
}

/**
 * This is a use-case-specific version of invariant which only fires when a programming error has
 * been made. It is never the right tool for validating input.
 */
#define invariant DUALBSON_invariant
#define DUALBSON_invariant(expression)                                          \
    do {                                                                        \
        if (DUALBSON_unlikely(!(expression))) {                                 \
            ::dualbson::invariantFailed(#expression, __FILE__, __LINE__);       \
        }                                                                       \
    } while (false)

/**
 * The purpose of this macro is to instruct the compiler that a line of code will never be reached.
 *
 * Example:
 *     // code above checks that expr can only be FOO or BAR
 *     switch (expr) {
 *     case FOO: { ... }
 *     case BAR: { ... }
 *     default:
 *         DUALBSON_UNREACHABLE;
 */
#define DUALBSON_UNREACHABLE ::dualbson::invariantFailed("Hit a DUALBSON_UNREACHABLE!", __FILE__, __LINE__);

/**
 * A utility function that converts an exception to a Status.
 * Only call this function when there is an active exception
 * (e.g. in a catch block).
 *
 * Example usage:
 *
 *   Status myFunc() {
 *       try {
 *           funcThatThrows();
 *           return Status::OK();
 *       } catch (const DBException&) {
 *           return exceptionToStatus();
 *       }
 *   }
 */
Status exceptionToStatus() noexcept;

}  // namespace dualbson

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

#define DUALBSON_LOGV2_DEFAULT_COMPONENT ::dualbson::logv2::LogComponent::kDefault

#include "dualbson/util/assert_util.h"

#include <typeinfo>

#include "dualbson/logv2/log.h"

namespace dualbson {

DBException::DBException(const Status& status) : _status(status) {
    invariant(!status.isOK());
}

void uassertedWithLocation(const Status& status, const char* file, unsigned line) {
    LOGV2_DEBUG(23074,
                1,
                "User assertion",
                "error"_attr = status,
                "file"_attr = file,
                "line"_attr = line);
    throw AssertionException(status);
}

void invariantFailed(const char* expr, const char* file, unsigned line) noexcept {
    LOGV2_FATAL_NOTRACE(23079,
                        "Invariant failure {expr} {file}:{line}",
                        "expr"_attr = expr,
                        "file"_attr = file,
                        "line"_attr = line);
}

Status exceptionToStatus() noexcept {
    try {
        throw;
    } catch (const DBException& ex) {
        return ex.toStatus();
    } catch (const std::exception& ex) {
        return Status(ErrorCodes::UnknownError,
                      std::string("Caught std::exception of type ") + typeid(ex).name() + ": " +
                          ex.what());
    }
}

}  // namespace dualbson

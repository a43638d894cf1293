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

#include "dualbson/base/error_codes.h"

#include <algorithm>
#include <iterator>
#include <ostream>

#include <fmt/format.h>

namespace dualbson {
namespace {

struct ErrorCodeInfo {
    ErrorCodes::Error code;
    const char* name;
    bool encodeError;
    bool decodeError;
};

// clang-format off
constexpr ErrorCodeInfo kErrorCodeTable[] = {
    {ErrorCodes::OK,                     "OK",                     false, false},
    {ErrorCodes::InternalError,          "InternalError",          false, false},
    {ErrorCodes::BadValue,               "BadValue",               false, false},
    {ErrorCodes::UnknownError,           "UnknownError",           false, false},
    {ErrorCodes::FailedToParse,          "FailedToParse",          false, true},
    {ErrorCodes::TypeMismatch,           "TypeMismatch",           false, true},
    {ErrorCodes::Overflow,               "Overflow",               false, true},
    {ErrorCodes::InvalidBSON,            "InvalidBSON",            false, true},
    {ErrorCodes::UnsupportedBSONMapping, "UnsupportedBSONMapping", true,  false},
    {ErrorCodes::UnrepresentableValue,   "UnrepresentableValue",   true,  false},
    {ErrorCodes::InvalidUTF8,            "InvalidUTF8",            false, true},
    {ErrorCodes::BSONObjectTooLarge,     "BSONObjectTooLarge",     true,  false},
};
// clang-format on

const ErrorCodeInfo* findInfo(ErrorCodes::Error code) {
    auto it = std::find_if(std::begin(kErrorCodeTable),
                           std::end(kErrorCodeTable),
                           [code](const ErrorCodeInfo& info) { return info.code == code; });
    return it == std::end(kErrorCodeTable) ? nullptr : &*it;
}

}  // namespace

std::string ErrorCodes::errorString(Error err) {
    if (auto info = findInfo(err))
        return info->name;
    return fmt::format("Location{}", static_cast<int>(err));
}

ErrorCodes::Error ErrorCodes::fromString(StringData name) {
    for (const auto& info : kErrorCodeTable) {
        if (name == info.name)
            return info.code;
    }
    return UnknownError;
}

bool ErrorCodes::isEncodeError(Error code) {
    auto info = findInfo(code);
    return info && info->encodeError;
}

bool ErrorCodes::isDecodeError(Error code) {
    auto info = findInfo(code);
    return info && info->decodeError;
}

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code) {
    return stream << ErrorCodes::errorString(code);
}

}  // namespace dualbson

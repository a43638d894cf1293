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

#include "dualbson/bson/bsontypes.h"

#include <ostream>

namespace dualbson {

/* take a BSONType and return the name of that type as a char* */
const char* typeName(BSONType type) {
    switch (type) {
        case BSONType::minKey:
            return "minKey";
        case BSONType::eoo:
            return "missing";
        case BSONType::numberDouble:
            return "double";
        case BSONType::string:
            return "string";
        case BSONType::object:
            return "object";
        case BSONType::array:
            return "array";
        case BSONType::binData:
            return "binData";
        case BSONType::undefined:
            return "undefined";
        case BSONType::oid:
            return "objectId";
        case BSONType::boolean:
            return "bool";
        case BSONType::date:
            return "date";
        case BSONType::null:
            return "null";
        case BSONType::regEx:
            return "regex";
        case BSONType::dbRef:
            return "dbPointer";
        case BSONType::code:
            return "javascript";
        case BSONType::symbol:
            return "symbol";
        case BSONType::codeWScope:
            return "javascriptWithScope";
        case BSONType::numberInt:
            return "int";
        case BSONType::timestamp:
            return "timestamp";
        case BSONType::numberLong:
            return "long";
        case BSONType::numberDecimal:
            return "decimal";
        case BSONType::maxKey:
            return "maxKey";
        default:
            return "invalid";
    }
}

bool isValidBSONType(int type) {
    switch (type) {
        case static_cast<int>(BSONType::minKey):
        case static_cast<int>(BSONType::eoo):
        case static_cast<int>(BSONType::numberDouble):
        case static_cast<int>(BSONType::string):
        case static_cast<int>(BSONType::object):
        case static_cast<int>(BSONType::array):
        case static_cast<int>(BSONType::binData):
        case static_cast<int>(BSONType::undefined):
        case static_cast<int>(BSONType::oid):
        case static_cast<int>(BSONType::boolean):
        case static_cast<int>(BSONType::date):
        case static_cast<int>(BSONType::null):
        case static_cast<int>(BSONType::regEx):
        case static_cast<int>(BSONType::dbRef):
        case static_cast<int>(BSONType::code):
        case static_cast<int>(BSONType::symbol):
        case static_cast<int>(BSONType::codeWScope):
        case static_cast<int>(BSONType::numberInt):
        case static_cast<int>(BSONType::timestamp):
        case static_cast<int>(BSONType::numberLong):
        case static_cast<int>(BSONType::numberDecimal):
        case static_cast<int>(BSONType::maxKey):
            return true;
        default:
            return false;
    }
}

std::ostream& operator<<(std::ostream& stream, BSONType type) {
    return stream << typeName(type);
}

}  // namespace dualbson

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

#include <cstdint>
#include <iosfwd>

namespace dualbson {

/**
 *  The complete list of valid BSON types. See also bsonspec.org.
 */
enum class BSONType : int {
    /** smaller than all other types */
    minKey = -1,
    /** end of object */
    eoo = 0,
    /** double precision floating point value */
    numberDouble = 1,
    /** character string, stored in utf8 */
    string = 2,
    /** an embedded object */
    object = 3,
    /** an embedded array */
    array = 4,
    /** binary data */
    binData = 5,
    /** (Deprecated) Undefined type */
    undefined = 6,
    /** ObjectId */
    oid = 7,
    /** boolean type */
    boolean = 8,
    /** date type */
    date = 9,
    /** null type */
    null = 10,
    /** regular expression, a pattern with options */
    regEx = 11,
    /** (Deprecated) */
    dbRef = 12,
    /** code type */
    code = 13,
    /** (Deprecated) a programming language (e.g., Python) symbol */
    symbol = 14,
    /** (Deprecated) javascript code that can execute on the database server, with SavedContext */
    codeWScope = 15,
    /** 32 bit signed integer */
    numberInt = 16,
    /** Two 32 bit signed integers */
    timestamp = 17,
    /** 64 bit integer */
    numberLong = 18,
    /** 128 bit decimal */
    numberDecimal = 19,
    /** larger than all other types */
    maxKey = 127
};

/**
 * returns the name of the argument's type
 */
const char* typeName(BSONType type);

/**
 * Returns whether or not 'type' can be converted to a valid BSONType.
 */
bool isValidBSONType(int type);

/**
 * Prints the name of the argument's type to the given stream.
 */
std::ostream& operator<<(std::ostream& stream, BSONType type);

}  // namespace dualbson

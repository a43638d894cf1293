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

#include "dualbson/base/data_range.h"
#include "dualbson/bson/bsonelement.h"

namespace dualbson {

/**
 * Non-owning view of a BSON document or array:
 *
 *   <int32 totalSize> {<byte type><cstring fieldName><value>}* EOO
 *
 * Construction validates the length header and the trailing EOO byte against the available
 * bytes. Elements are validated as they are iterated. Anything malformed throws InvalidBSON.
 */
class BSONObj {
public:
    /** Views the document at the start of `buffer`, which must hold all of it. */
    explicit BSONObj(ConstDataRange buffer);

    const char* objdata() const {
        return _data;
    }

    int objsize() const {
        return _size;
    }

    /** True for the minimal 5 byte document. */
    bool isEmpty() const {
        return _size == kMinBSONLength;
    }

    /** Number of elements. Walks the whole document. */
    int nFields() const;

    static constexpr int kMinBSONLength = 5;

private:
    const char* _data;
    int _size;
};

/**
 * Iterates the elements of a BSONObj in stored order, checking each against the end of the
 * document before returning it.
 *
 * Example:
 *   BSONObjIterator it(obj);
 *   while (it.more()) {
 *       BSONElement e = it.next();
 *       ...
 *   }
 */
class BSONObjIterator {
public:
    explicit BSONObjIterator(const BSONObj& obj);

    /** True while an element other than the terminating EOO remains. */
    bool more() const {
        return _pos < _theend;
    }

    BSONElement next();

private:
    const char* _pos;
    // Points at the EOO byte.
    const char* _theend;
};

}  // namespace dualbson

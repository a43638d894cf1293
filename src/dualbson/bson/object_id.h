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
#include <ostream>
#include <string>

#include "dualbson/base/status_with.h"
#include "dualbson/base/string_data.h"
#include "dualbson/bson/family.h"
#include "dualbson/bson/oid.h"
#include "dualbson/util/time_support.h"

namespace dualbson {

namespace legacy {

/**
 * Identifier of the legacy family. The zero value, all twelve bytes clear, is the empty id and
 * is what a null or missing wire value decodes to.
 */
class ObjectId {
public:
    static constexpr Family kFamily = Family::kLegacy;

    ObjectId() = default;
    explicit ObjectId(const OID& oid) : _oid(oid) {}

    /** Returns the canonical 24 character lowercase hex representation. */
    std::string hex() const {
        return _oid.toString();
    }

    /** The creation time embedded in the id, with second precision. */
    Date_t time() const {
        return _oid.asDateT();
    }

    /** The 3 byte counter portion of the id. */
    int32_t counter() const {
        return static_cast<int32_t>(_oid.getIncrement());
    }

    /** False for the empty id. */
    bool valid() const {
        return _oid.isSet();
    }

    const OID& oid() const {
        return _oid;
    }

    bool operator==(const ObjectId& other) const {
        return _oid == other._oid;
    }
    bool operator!=(const ObjectId& other) const {
        return _oid != other._oid;
    }
    bool operator<(const ObjectId& other) const {
        return _oid < other._oid;
    }

private:
    OID _oid;
};

inline std::ostream& operator<<(std::ostream& os, const ObjectId& id) {
    return os << "ObjectIdHex(\"" << id.hex() << "\")";
}

/** Returns a freshly generated id. */
ObjectId NewObjectId();

/**
 * Returns an id whose timestamp portion is `t` and whose remaining bytes are zero. Only useful
 * as a range bound in queries.
 */
ObjectId NewObjectIdWithTime(Date_t t);

/** Parses 24 hex digits. Throws FailedToParse on anything else. */
ObjectId ObjectIdHex(StringData s);

/** True if `s` is a valid ObjectIdHex argument. */
bool isObjectIdHex(StringData s);

}  // namespace legacy

namespace current {

/**
 * Identifier of the current family. Unlike the legacy id, a null wire value does not decode into
 * it.
 */
class ObjectID {
public:
    static constexpr Family kFamily = Family::kCurrent;

    ObjectID() = default;
    explicit ObjectID(const OID& oid) : _oid(oid) {}

    std::string hex() const {
        return _oid.toString();
    }

    Date_t timestamp() const {
        return _oid.asDateT();
    }

    bool isZero() const {
        return !_oid.isSet();
    }

    const OID& oid() const {
        return _oid;
    }

    bool operator==(const ObjectID& other) const {
        return _oid == other._oid;
    }
    bool operator!=(const ObjectID& other) const {
        return _oid != other._oid;
    }
    bool operator<(const ObjectID& other) const {
        return _oid < other._oid;
    }

private:
    OID _oid;
};

inline std::ostream& operator<<(std::ostream& os, const ObjectID& id) {
    return os << "ObjectID(\"" << id.hex() << "\")";
}

ObjectID NewObjectID();

/** Returns an id with the given timestamp followed by zero bytes. */
ObjectID NewObjectIDFromTimestamp(Date_t t);

/** Parses 24 hex digits, either case. */
StatusWith<ObjectID> ObjectIDFromHex(StringData s);

}  // namespace current

}  // namespace dualbson

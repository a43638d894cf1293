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

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dualbson/base/string_data.h"
#include "dualbson/bson/bsontypes.h"
#include "dualbson/bson/codec_options.h"
#include "dualbson/bson/document.h"
#include "dualbson/bson/object_id.h"
#include "dualbson/bson/regex.h"
#include "dualbson/bson/util/builder.h"
#include "dualbson/bson/value.h"
#include "dualbson/util/time_support.h"

namespace dualbson {

/**
 * Builds canonical BSON for values of either family.
 *
 * The encoder writes into one buffer. Documents are opened with beginDocument() or
 * beginSubDocument() and closed with endDocument(), which back-patches the length. Elements are
 * appended to the innermost open document.
 *
 *   ValueEncoder enc(options);
 *   enc.beginDocument();
 *   enc.appendString("name", "abc");
 *   enc.endDocument();
 *   std::vector<char> bytes = enc.release();
 *
 * Every failure throws an AssertionException with an EncodeError code and leaves the encoder
 * unusable.
 */
class ValueEncoder {
public:
    explicit ValueEncoder(const EncodeOptions& options = {});

    /** Opens the top level document. */
    void beginDocument();

    /** Opens an embedded document or array as element `name` of the current document. */
    void beginSubDocument(StringData name, BSONType type);

    /** Closes the innermost open document. */
    void endDocument();

    /** Returns the encoded bytes. All documents must be closed. */
    std::vector<char> release();

    int depth() const {
        return static_cast<int>(_docStarts.size());
    }

    void appendNull(StringData name);
    void appendBool(StringData name, bool b);
    void appendInt32(StringData name, int32_t i);
    void appendInt64(StringData name, int64_t i);

    /** Fails with UnrepresentableValue above INT64_MAX. */
    void appendUInt64(StringData name, uint64_t u);

    /** int32 when the value fits, int64 otherwise. */
    void appendNativeInt(StringData name, int64_t i);

    void appendDouble(StringData name, double d);
    void appendString(StringData name, StringData s);
    void appendDate(StringData name, Date_t date);
    void appendOID(StringData name, const OID& oid);

    /** The options are written sorted. */
    void appendRegex(StringData name, StringData pattern, StringData options);

    void appendValue(StringData name, const Value& value);

    /**
     * Appends the entries of a container value to the current document. Used to write a generic
     * value as the top level document. Fails with UnsupportedBSONMapping for other kinds.
     */
    void appendFieldsOf(const Value& value);

    template <Family F>
    void appendDocument(StringData name, const UnorderedDocument<F>& doc) {
        beginSubDocument(name, BSONType::object);
        appendFields(doc);
        endDocument();
    }

    template <Family F>
    void appendDocument(StringData name, const OrderedDocument<F>& doc) {
        beginSubDocument(name, BSONType::object);
        appendFields(doc);
        endDocument();
    }

    template <Family F>
    void appendArray(StringData name, const Sequence<F>& seq) {
        beginSubDocument(name, BSONType::array);
        appendFields(seq);
        endDocument();
    }

    /** Appends the entries of `doc` to the current document, in sorted key order. */
    template <Family F>
    void appendFields(const UnorderedDocument<F>& doc) {
        for (const auto& [key, value] : doc) {
            appendValue(key, value);
        }
    }

    /** Appends the entries of `doc` to the current document, in stored order. */
    template <Family F>
    void appendFields(const OrderedDocument<F>& doc) {
        for (const auto& elem : doc) {
            appendValue(elem.name, elem.value);
        }
    }

    /** Appends the values of `seq` to the current document under the keys "0", "1", ... */
    template <Family F>
    void appendFields(const Sequence<F>& seq) {
        std::size_t index = 0;
        for (const auto& value : seq) {
            appendValue(std::to_string(index++), value);
        }
    }

private:
    void appendElementHeader(BSONType type, StringData name);

    EncodeOptions _options;
    BufBuilder _b;
    // Offsets of the length prefix of each open document, outermost first.
    std::vector<std::size_t> _docStarts;
};

/** True if `s` contains a NUL byte, which cannot be written as a BSON cstring. */
inline bool containsNul(StringData s) {
    return s.find('\0') != StringData::npos;
}

}  // namespace dualbson

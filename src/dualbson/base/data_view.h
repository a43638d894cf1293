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
#include <cstring>
#include <type_traits>

#include <boost/endian/conversion.hpp>

namespace dualbson {

/**
 * Byte order tags for ConstDataView::read and DataView::write. BSON is little endian throughout,
 * except for the timestamp and counter inside an ObjectId, which are big endian.
 */
template <typename T>
struct LittleEndian {
    using value_type = T;
    static T toNative(T t) {
        return boost::endian::little_to_native(t);
    }
    static T fromNative(T t) {
        return boost::endian::native_to_little(t);
    }
};

template <typename T>
struct BigEndian {
    using value_type = T;
    static T toNative(T t) {
        return boost::endian::big_to_native(t);
    }
    static T fromNative(T t) {
        return boost::endian::native_to_big(t);
    }
};

class ConstDataView {
public:
    typedef const char* bytes_type;

    ConstDataView(bytes_type bytes) : _bytes(bytes) {}

    bytes_type view(std::size_t offset = 0) const {
        return _bytes + offset;
    }

    template <typename Endian>
    typename Endian::value_type read(std::size_t offset = 0) const {
        using T = typename Endian::value_type;
        static_assert(std::is_integral_v<T>, "use readDouble for floating point values");
        T t;
        std::memcpy(&t, view(offset), sizeof(T));
        return Endian::toNative(t);
    }

    double readDouble(std::size_t offset = 0) const {
        auto bits = read<LittleEndian<std::uint64_t>>(offset);
        double d;
        std::memcpy(&d, &bits, sizeof(d));
        return d;
    }

private:
    bytes_type _bytes;
};

class DataView : public ConstDataView {
public:
    typedef char* bytes_type;

    DataView(bytes_type bytes) : ConstDataView(bytes) {}

    bytes_type view(std::size_t offset = 0) const {
        // It is safe to cast away const here since the pointer stored in our base class was
        // originally non-const by way of our constructor.
        return const_cast<bytes_type>(ConstDataView::view(offset));
    }

    template <typename Endian>
    DataView& write(typename Endian::value_type value, std::size_t offset = 0) {
        auto t = Endian::fromNative(value);
        std::memcpy(view(offset), &t, sizeof(t));
        return *this;
    }

    DataView& writeDouble(double value, std::size_t offset = 0) {
        std::uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        return write<LittleEndian<std::uint64_t>>(bits, offset);
    }
};

}  // namespace dualbson

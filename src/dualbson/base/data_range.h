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
#include <type_traits>

namespace dualbson {

/**
 * A non-owning view over a contiguous range of bytes. The bytes must outlive the view.
 */
class ConstDataRange {
    template <typename T>
    constexpr static auto isByteV = ((std::is_integral_v<T> && sizeof(T) == 1) ||
                                     std::is_same_v<T, std::byte>);

    template <typename T, typename = void>
    struct ContiguousContainerOfByteLike : std::false_type {};

    template <typename T>
    struct ContiguousContainerOfByteLike<
        T,
        std::void_t<decltype(std::declval<T>().data()),
                    decltype(std::declval<T>().size()),
                    std::enable_if_t<isByteV<typename T::value_type>>>> : std::true_type {};

public:
    using byte_type = char;

    // Constructing from nullptr, nullptr initializes an empty ConstDataRange.
    ConstDataRange(std::nullptr_t, std::nullptr_t) : _begin(nullptr), _end(nullptr) {}

    // You can construct from a pointer to a byte-like type and a size.
    template <typename ByteLike, typename std::enable_if_t<isByteV<ByteLike>, int> = 0>
    ConstDataRange(const ByteLike* begin, std::size_t length)
        : _begin(reinterpret_cast<const byte_type*>(begin)), _end(_begin + length) {}

    // ConstDataRange can also act as a view of a container of byte-like values, such as a
    // std::vector<char> or a std::string.
    template <typename Container,
              typename std::enable_if_t<ContiguousContainerOfByteLike<Container>::value, int> = 0>
    ConstDataRange(const Container& container)
        : ConstDataRange(container.data(), container.size()) {}

    const byte_type* data() const noexcept {
        return _begin;
    }

    std::size_t length() const noexcept {
        return _end - _begin;
    }

    bool empty() const noexcept {
        return length() == 0;
    }

private:
    const byte_type* _begin;
    const byte_type* _end;
};

}  // namespace dualbson

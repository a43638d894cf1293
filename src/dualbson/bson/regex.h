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

#include <ostream>
#include <string>

#include "dualbson/bson/family.h"

namespace dualbson {

/**
 * A BSON regular expression: a pattern and its option letters. Neither string is interpreted.
 * Each family has its own type so that a generic value remembers which one it holds.
 */
template <Family F>
struct RegexValue {
    static constexpr Family kFamily = F;

    std::string pattern;
    std::string options;

    bool operator==(const RegexValue& other) const {
        return pattern == other.pattern && options == other.options;
    }
    bool operator!=(const RegexValue& other) const {
        return !(*this == other);
    }

    std::string toString() const {
        return "/" + pattern + "/" + options;
    }
};

template <Family F>
std::ostream& operator<<(std::ostream& os, const RegexValue<F>& re) {
    return os << re.toString();
}

namespace legacy {
using RegEx = RegexValue<Family::kLegacy>;
}  // namespace legacy

namespace current {
using Regex = RegexValue<Family::kCurrent>;
}  // namespace current

}  // namespace dualbson

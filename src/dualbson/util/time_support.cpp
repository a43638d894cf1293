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

#include "dualbson/util/time_support.h"

#include <ctime>
#include <ostream>

#include <fmt/format.h>

namespace dualbson {

namespace {

long long floorDiv(long long num, long long den) {
    long long q = num / den;
    if ((num % den != 0) && ((num < 0) != (den < 0)))
        --q;
    return q;
}

}  // namespace

Date_t Date_t::now() {
    return fromSystemTimePoint(std::chrono::system_clock::now());
}

Date_t Date_t::fromSystemTimePoint(const std::chrono::system_clock::time_point& tp) {
    return fromMillisSinceEpoch(
        std::chrono::floor<Milliseconds>(tp.time_since_epoch()).count());
}

std::chrono::system_clock::time_point Date_t::toSystemTimePoint() const {
    return std::chrono::system_clock::time_point{} +
        std::chrono::duration_cast<std::chrono::system_clock::duration>(Milliseconds(millis));
}

long long Date_t::toTimeT() const {
    return floorDiv(millis, 1000);
}

bool Date_t::isFormattable() const {
    if (millis < 0)
        return false;
    // Years past 9999 do not fit the four digit year of the ISO 8601 rendering.
    return millis < 253402300800000LL;
}

std::string Date_t::toString() const {
    if (!isFormattable())
        return fmt::format("new Date({})", millis);

    std::time_t t = static_cast<std::time_t>(toTimeT());
    std::tm tm{};
    gmtime_r(&t, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900,
                       tm.tm_mon + 1,
                       tm.tm_mday,
                       tm.tm_hour,
                       tm.tm_min,
                       tm.tm_sec,
                       millis % 1000);
}

std::ostream& operator<<(std::ostream& os, Date_t date) {
    return os << date.toString();
}

}  // namespace dualbson

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

#include "dualbson/bson/oid.h"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <random>

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>

#include "dualbson/util/hex.h"

namespace dualbson {

namespace {

const std::size_t kTimestampOffset = 0;
const std::size_t kInstanceUniqueOffset = kTimestampOffset + OID::kTimestampSize;
const std::size_t kIncrementOffset = kInstanceUniqueOffset + OID::kInstanceUniqueSize;

// Process wide generator state, seeded once from the system entropy source.
struct Generator {
    Generator() {
        std::random_device entropy;
        std::uniform_int_distribution<unsigned> byte(0, 255);
        for (auto& b : instanceUnique)
            b = static_cast<uint8_t>(byte(entropy));
        counter.store(entropy());
    }

    uint8_t instanceUnique[OID::kInstanceUniqueSize];
    std::atomic<uint32_t> counter;
};

Generator& generator() {
    static Generator gen;
    return gen;
}

}  // namespace

void OID::setTimestamp(const OID::Timestamp timestamp) {
    _view().write<BigEndian<Timestamp>>(timestamp, kTimestampOffset);
}

OID::Timestamp OID::getTimestamp() const {
    return view().read<BigEndian<Timestamp>>(kTimestampOffset);
}

uint32_t OID::getIncrement() const {
    auto bytes = reinterpret_cast<const unsigned char*>(view().view(kIncrementOffset));
    return (uint32_t(bytes[0]) << 16) | (uint32_t(bytes[1]) << 8) | uint32_t(bytes[2]);
}

size_t OID::Hasher::operator()(const OID& oid) const {
    size_t seed = 0;
    uint32_t v;
    for (int i = 0; i != kOIDSize; i += sizeof(uint32_t)) {
        std::memcpy(&v, oid._data + i, sizeof(uint32_t));
        boost::hash_combine(seed, v);
    }
    return seed;
}

void OID::init() {
    auto& gen = generator();

    // each set* method handles endianness
    setTimestamp(static_cast<Timestamp>(std::time(nullptr)));
    std::memcpy(_view().view(kInstanceUniqueOffset), gen.instanceUnique, kInstanceUniqueSize);

    uint32_t nextCtr = gen.counter.fetch_add(1);
    char* inc = _view().view(kIncrementOffset);
    inc[0] = char(uint8_t(nextCtr >> 16));
    inc[1] = char(uint8_t(nextCtr >> 8));
    inc[2] = char(uint8_t(nextCtr));
}

void OID::init(Date_t date) {
    setTimestamp(static_cast<Timestamp>(uint32_t(date.toTimeT())));
    std::memset(_view().view(kInstanceUniqueOffset), 0, kInstanceUniqueSize + kIncrementSize);
}

bool OID::isValidHex(StringData input) {
    return input.size() == 2 * kOIDSize && std::all_of(input.begin(), input.end(), isHexit);
}

StatusWith<OID> OID::parse(StringData input) {
    if (input.size() != (2 * kOIDSize)) {
        return {ErrorCodes::FailedToParse,
                fmt::format("Invalid string length for parsing to OID, expected {} but found {}",
                            2 * kOIDSize,
                            input.size())};
    }

    for (char c : input) {
        if (!isHexit(c)) {
            return {ErrorCodes::FailedToParse,
                    fmt::format("Invalid character found in hex string: {}", c)};
        }
    }

    std::string blob = hexblob::decode(input);
    return OID::from(blob.data());
}

time_t OID::asTimeT() const {
    return static_cast<uint32_t>(getTimestamp());
}

std::string OID::toString() const {
    return hexblob::encodeLower(_data, kOIDSize);
}

std::string OID::toIncString() const {
    return hexblob::encodeLower(view().view(kIncrementOffset), kIncrementSize);
}

}  // namespace dualbson

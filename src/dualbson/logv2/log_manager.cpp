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

#include "dualbson/logv2/log.h"

#include <array>
#include <atomic>
#include <cstdlib>
#include <string>

#include <boost/log/core.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <fmt/args.h>
#include <fmt/format.h>

#include "dualbson/util/time_support.h"

namespace dualbson::logv2 {

namespace {

namespace trivial = boost::log::trivial;

// Minimum severity per component, stored as LogSeverity::toInt(). Larger is less severe.
// Value-initialized to 0, which is LogSeverity::Log().
std::array<std::atomic<int>, LogComponent::kNumLogComponents> gMinimumSeverity{};

trivial::severity_level toBoostSeverity(LogSeverity severity) {
    if (severity == LogSeverity::Severe())
        return trivial::fatal;
    if (severity == LogSeverity::Error())
        return trivial::error;
    if (severity == LogSeverity::Warning())
        return trivial::warning;
    if (severity == LogSeverity::Info() || severity == LogSeverity::Log())
        return trivial::info;
    return severity == LogSeverity::Debug(1) ? trivial::debug : trivial::trace;
}

std::string escapeJson(StringData s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned char>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// Substitutes {name} replacement fields in the message with attribute values. A message that
// does not parse as a format string is emitted verbatim.
std::string formatMessage(StringData message, const TypeErasedAttributeStorage& attrs) {
    if (message.find('{') == StringData::npos)
        return std::string{message};

    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto& attr : attrs) {
        store.push_back(fmt::arg(attr.name, attr.value));
    }
    try {
        return fmt::vformat(fmt::string_view(message.data(), message.size()), store);
    } catch (const fmt::format_error&) {
        return std::string{message};
    }
}

class LogManager {
public:
    LogManager() {
        boost::log::add_common_attributes();
    }

    void write(trivial::severity_level level, const std::string& record) {
        BOOST_LOG_SEV(_source, level) << record;
    }

private:
    boost::log::sources::severity_logger_mt<trivial::severity_level> _source;
};

LogManager& globalLogManager() {
    static LogManager manager;
    return manager;
}

}  // namespace

void setMinimumLoggedSeverity(LogSeverity severity) {
    for (auto& s : gMinimumSeverity)
        s.store(severity.toInt());
}

void setMinimumLoggedSeverity(LogComponent component, LogSeverity severity) {
    gMinimumSeverity[component].store(severity.toInt());
}

LogSeverity getMinimumLogSeverity(LogComponent component) {
    return LogSeverity::cast(gMinimumSeverity[component].load());
}

bool shouldLog(LogComponent component, LogSeverity severity) {
    return severity >= getMinimumLogSeverity(component);
}

namespace detail {

void doLogImpl(int32_t id,
               LogSeverity const& severity,
               LogComponent component,
               StringData message,
               TypeErasedAttributeStorage attrs) {
    if (!shouldLog(component, severity))
        return;

    std::string record = fmt::format(R"({{"t":{{"$date":"{}"}},"s":"{}","c":"{}","id":{},"msg":"{}")",
                                     Date_t::now().toString(),
                                     severity.toStringDataCompact(),
                                     component.getShortName(),
                                     id,
                                     escapeJson(formatMessage(message, attrs)));
    if (!attrs.empty()) {
        record += R"(,"attr":{)";
        bool first = true;
        for (const auto& attr : attrs) {
            if (!first)
                record += ',';
            first = false;
            record += fmt::format(R"("{}":"{}")", attr.name, escapeJson(attr.value));
        }
        record += '}';
    }
    record += '}';

    globalLogManager().write(toBoostSeverity(severity), record);
}

void logFatalAndAbort() {
    boost::log::core::get()->flush();
    std::abort();
}

}  // namespace detail
}  // namespace dualbson::logv2

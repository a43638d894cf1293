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

/**
 * Unstructured and structured logging.
 *
 * A translation unit that logs defines DUALBSON_LOGV2_DEFAULT_COMPONENT before including this
 * header:
 *
 *   #define DUALBSON_LOGV2_DEFAULT_COMPONENT ::dualbson::logv2::LogComponent::kBson
 *   #include "dualbson/logv2/log.h"
 *
 *   LOGV2(1000001, "Decoded document", "size"_attr = size);
 *
 * The message may refer to attributes by name with {fmt} replacement fields, "{size}".
 * Every log statement carries a unique numeric id.
 */

#pragma once

#include "dualbson/logv2/log_detail.h"

namespace dualbson::logv2 {

/** Records less severe than `severity` are dropped for every component. */
void setMinimumLoggedSeverity(LogSeverity severity);
void setMinimumLoggedSeverity(LogComponent component, LogSeverity severity);

LogSeverity getMinimumLogSeverity(LogComponent component);

/** True if a record of `severity` for `component` would be emitted. */
bool shouldLog(LogComponent component, LogSeverity severity);

}  // namespace dualbson::logv2

#define DUALBSON_LOGV2_IMPL(ID, SEVERITY, COMPONENT, MESSAGE, ...) \
    ::dualbson::logv2::detail::doLog(                             \
        ID, SEVERITY, COMPONENT, MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2(ID, MESSAGE, ...)                                    \
    DUALBSON_LOGV2_IMPL(ID,                                        \
                        ::dualbson::logv2::LogSeverity::Log(),     \
                        DUALBSON_LOGV2_DEFAULT_COMPONENT,          \
                        MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_WARNING(ID, MESSAGE, ...)                            \
    DUALBSON_LOGV2_IMPL(ID,                                        \
                        ::dualbson::logv2::LogSeverity::Warning(), \
                        DUALBSON_LOGV2_DEFAULT_COMPONENT,          \
                        MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_ERROR(ID, MESSAGE, ...)                              \
    DUALBSON_LOGV2_IMPL(ID,                                        \
                        ::dualbson::logv2::LogSeverity::Error(),   \
                        DUALBSON_LOGV2_DEFAULT_COMPONENT,          \
                        MESSAGE __VA_OPT__(, ) __VA_ARGS__)

/**
 * Logs at severity Severe and aborts the process without printing a stack trace.
 */
#define LOGV2_FATAL_NOTRACE(ID, MESSAGE, ...)                       \
    do {                                                            \
        DUALBSON_LOGV2_IMPL(ID,                                     \
                            ::dualbson::logv2::LogSeverity::Severe(), \
                            DUALBSON_LOGV2_DEFAULT_COMPONENT,       \
                            MESSAGE __VA_OPT__(, ) __VA_ARGS__);    \
        ::dualbson::logv2::detail::logFatalAndAbort();              \
    } while (false)

/**
 * Debug records are only built when their level is enabled for the component, so the attribute
 * expressions are not evaluated otherwise.
 */
#define LOGV2_DEBUG(ID, DLEVEL, MESSAGE, ...)                                             \
    do {                                                                                  \
        auto severity_ = ::dualbson::logv2::LogSeverity::Debug(DLEVEL);                   \
        if (::dualbson::logv2::shouldLog(DUALBSON_LOGV2_DEFAULT_COMPONENT, severity_)) {  \
            DUALBSON_LOGV2_IMPL(ID,                                                       \
                                severity_,                                                \
                                DUALBSON_LOGV2_DEFAULT_COMPONENT,                         \
                                MESSAGE __VA_OPT__(, ) __VA_ARGS__);                      \
        }                                                                                 \
    } while (false)

#pragma once

#include "runmap/core/logger.h"

// Partition-aware logging. The partition decides whether the message is
// emitted, so arguments are never formatted for a silenced component.
#define PLOGE(partition, ...)                    \
    if ((partition).should_log(LogLevel::ERROR)) \
    (partition).log(                             \
        LogLevel::ERROR,                         \
        __VA_ARGS__,                             \
        " (",                                    \
        __RELATIVE_FILEPATH__,                   \
        ":",                                     \
        __LINE__,                                \
        ")")
#define PLOGW(partition, ...)                      \
    if ((partition).should_log(LogLevel::WARNING)) \
    (partition).log(                               \
        LogLevel::WARNING,                         \
        __VA_ARGS__,                               \
        " (",                                      \
        __RELATIVE_FILEPATH__,                     \
        ":",                                       \
        __LINE__,                                  \
        ")")
#define PLOGI(partition, ...)                   \
    if ((partition).should_log(LogLevel::INFO)) \
    (partition).log(                            \
        LogLevel::INFO,                         \
        __VA_ARGS__,                            \
        " (",                                   \
        __RELATIVE_FILEPATH__,                  \
        ":",                                    \
        __LINE__,                               \
        ")")
#define PLOGD(partition, ...)                    \
    if ((partition).should_log(LogLevel::DEBUG)) \
    (partition).log(                             \
        LogLevel::DEBUG,                         \
        __VA_ARGS__,                             \
        " (",                                    \
        __RELATIVE_FILEPATH__,                   \
        ":",                                     \
        __LINE__,                                \
        ")")

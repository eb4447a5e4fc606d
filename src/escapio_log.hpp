/*
Copyright (c) 2021, Sergei Ilinykh <rion4ik@gmail.com>

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.
2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE FOR
ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
(INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
(INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/

#pragma once

#include <functional>
#include <sstream>
#include <string>

#include <boost/log/trivial.hpp>

namespace escapio {

class Log {
public:
    using Severity   = boost::log::trivial::severity_level;
    using LogHandler = std::function<void(Severity, std::string &&)>;

    // Receives malformed-input traces and context errors instead of the Boost.Log trivial logger.
    // An empty handler restores the trivial logger.
    inline void setHandler(LogHandler &&handler) { handler_ = std::move(handler); }

    inline Severity level() const { return level_; }

    void setLevel(Severity level) { level_ = level; }

    void log(Severity level, std::string &&message);

private:
    Severity   level_ = Severity::debug;
    LogHandler handler_;
};

extern Log log;

#define ESCAPIO_LOG(log_level, logmsg)                                                                                 \
    do {                                                                                                               \
        if (log_level >= ::escapio::log.level()) {                                                                     \
            std::stringstream log_stream;                                                                              \
            log_stream << logmsg;                                                                                      \
            ::escapio::log.log(log_level, log_stream.str());                                                           \
        }                                                                                                              \
    } while (false)

#define ESCAPIO_ERROR(logmsg) ESCAPIO_LOG(::boost::log::trivial::severity_level::error, logmsg)
#define ESCAPIO_DEBUG(logmsg) ESCAPIO_LOG(::boost::log::trivial::severity_level::debug, logmsg)
#define ESCAPIO_TRACE(logmsg) ESCAPIO_LOG(::boost::log::trivial::severity_level::trace, logmsg)

} // namespace escapio

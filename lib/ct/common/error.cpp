/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cerrno>
#include <cstring>
#include <typeinfo>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <ct/logger.hpp>

namespace ctap_turbo {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        // skips the frames of safe_dump_to, base_error and error
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    std::string_view base_error::stacktrace() const noexcept
    {
        thread_local std::array<char, 0x2000> buf {};
        boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
        os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
        // an overflowing dump is truncated to the capacity of the buffer
        const std::streamoff end = os.tellp();
        const size_t len = end >= 0 ? static_cast<size_t>(end) : buf.size() - 1;
        buf[len] = 0;
        return { buf.data(), len };
    }

    const char *base_error::what() const noexcept
    {
        logger::debug("{}\nstacktrace of an exception reported to the user:\n{}", _msg, stacktrace());
        return _msg.c_str();
    }

    error::error(const std::string_view msg)
        : base_error { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &ex)
        : error { fmt::format("{} caused by {}: {}", msg, typeid(ex).name(), ex.what()) }
    {
    }

    error_sys::error_sys(const std::string_view msg)
        : error { fmt::format("{} errno: {} strerror: {}", msg, errno, std::strerror(errno)) }
    {
    }
}

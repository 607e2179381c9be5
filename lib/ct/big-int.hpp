/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CTAP_TURBO_BIG_INT_HPP
#define CTAP_TURBO_BIG_INT_HPP

#include <sstream>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <ct/common/bytes.hpp>

namespace ctap_turbo {
    using boost::multiprecision::cpp_int;
    using boost::multiprecision::int128_t;

    static constexpr size_t big_int_max_size = 8192;

    // interprets the bytes as a big-endian unsigned integer
    inline cpp_int big_int_from_bytes(const buffer data)
    {
        if (data.size() > big_int_max_size)
            throw error(fmt::format("big ints larger than {} bytes are not supported but got: {}!", big_int_max_size, data.size()));
        cpp_int val {};
        for (const uint8_t b: data) {
            val <<= 8;
            val |= b;
        }
        return val;
    }
}

namespace fmt {
    template<typename T, boost::multiprecision::expression_template_option E>
    struct formatter<boost::multiprecision::number<T, E>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !CTAP_TURBO_BIG_INT_HPP

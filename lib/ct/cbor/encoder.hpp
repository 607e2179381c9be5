/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CTAP_TURBO_CBOR_ENCODER_HPP
#define CTAP_TURBO_CBOR_ENCODER_HPP

#include <functional>
#include <ct/common/bytes.hpp>
#include <ct/cbor/head.hpp>
#include <ct/cbor/value.hpp>

namespace ctap_turbo::cbor {
    /*
     * Appends canonical data items to a byte vector.
     * The caller is responsible for writing the announced number of items after array and map.
     */
    struct encoder {
        encoder &array(const size_t sz)
        {
            write_head(_buf, major_type::array, sz);
            return *this;
        }

        encoder &map(const size_t sz)
        {
            write_head(_buf, major_type::map, sz);
            return *this;
        }

        encoder &uint(const uint64_t val)
        {
            write_head(_buf, major_type::uint, val);
            return *this;
        }

        // the argument of a negative integer n is -1 - n
        encoder &nint(const uint64_t val)
        {
            write_head(_buf, major_type::nint, val);
            return *this;
        }

        encoder &integer(const int_type &val)
        {
            if (val < value::min_int() || val > value::max_int()) [[unlikely]]
                throw ctap_turbo::error(fmt::format("integer {} is outside of the range representable in CBOR", val));
            if (val >= 0)
                return uint(static_cast<uint64_t>(val));
            return nint(static_cast<uint64_t>(int_type { -1 } - val));
        }

        encoder &bytes(const buffer buf)
        {
            write_head(_buf, major_type::bytes, buf.size());
            _buf << buf;
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            write_head(_buf, major_type::text, sv.size());
            _buf << buffer { sv };
            return *this;
        }

        encoder &tag(const uint64_t id)
        {
            write_head(_buf, major_type::tag, id);
            return *this;
        }

        encoder &simple(const uint8_t code)
        {
            write_head(_buf, major_type::simple, check_simple(code).code);
            return *this;
        }

        encoder &s_false()
        {
            return simple(static_cast<uint8_t>(special_val::s_false));
        }

        encoder &s_true()
        {
            return simple(static_cast<uint8_t>(special_val::s_true));
        }

        encoder &s_null()
        {
            return simple(static_cast<uint8_t>(special_val::s_null));
        }

        encoder &s_undefined()
        {
            return simple(static_cast<uint8_t>(special_val::s_undefined));
        }

        encoder &float16(const uint16_t bits)
        {
            write_float_head(_buf, special_val::two_bytes, bits);
            return *this;
        }

        encoder &float32(const float val)
        {
            write_float_head(_buf, special_val::four_bytes, std::bit_cast<uint32_t>(val));
            return *this;
        }

        encoder &float64(const double val)
        {
            write_float_head(_buf, special_val::eight_bytes, std::bit_cast<uint64_t>(val));
            return *this;
        }

        encoder &floating(const float_item &f);

        // appends an already encoded data item as is
        encoder &raw_cbor(const buffer buf)
        {
            _buf << buf;
            return *this;
        }

        // appends v with map pairs in the canonical order, v itself is not modified
        encoder &item(const value &v);

        encoder &custom(const std::function<void(encoder &)> &gen)
        {
            gen(*this);
            return *this;
        }

        [[nodiscard]] uint8_vector &cbor()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};
    };

    inline encoder &operator<<(encoder &dst, const encoder &src)
    {
        dst.cbor() << src.cbor();
        return dst;
    }

    extern void encode(encoder &enc, const value &v);
    extern uint8_vector encode(const value &v);
}

#endif // !CTAP_TURBO_CBOR_ENCODER_HPP

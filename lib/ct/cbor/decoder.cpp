/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <new>
#include <ct/cbor/decoder.hpp>
#include <ct/cbor/head.hpp>

namespace ctap_turbo::cbor {
    namespace {
    struct decoder {
        decoder(const buffer data, const size_t offset, const decode_options &opts):
            _data { data }, _pos { offset }, _opts { opts }
        {
        }

        size_t pos() const noexcept
        {
            return _pos;
        }

        value read(const size_t depth)
        {
            if (depth > _opts.max_depth) [[unlikely]]
                throw error(error_kind::malformed, fmt::format("data items are nested deeper than {} levels", _opts.max_depth));
            head h {};
            switch (read_head(_remaining(), h)) {
                case head_status::ok:
                    break;
                case head_status::truncated:
                    throw error(error_kind::malformed, fmt::format("truncated item head at offset {}", _pos));
                case head_status::reserved_ai:
                    if (h.type == major_type::simple)
                        throw error(error_kind::malformed, fmt::format("invalid additional information {} of a simple value at offset {}", h.ai, _pos));
                    throw error(error_kind::reserved_additional_information, fmt::format("reserved additional information {} at offset {}", h.ai, _pos));
                case head_status::indefinite:
                    throw error(error_kind::indefinite_length, fmt::format("an indefinite-length {} at offset {}", h.type, _pos));
            }
            _pos += h.size;
            switch (h.type) {
                case major_type::uint:
                    return value::from_int(h.arg);
                case major_type::nint:
                    return value::from_int(int_type { -1 } - h.arg);
                case major_type::bytes:
                    return value::from_bytes(_read_data(h.arg));
                case major_type::text:
                    return value::from_text(_read_data(h.arg).string_view());
                case major_type::array:
                    return _read_array(h.arg, depth);
                case major_type::map:
                    return _read_map(h.arg, depth);
                case major_type::tag: {
                    auto content = read(depth + 1);
                    return value::from_tag(h.arg, std::move(content));
                }
                case major_type::simple:
                    return _read_simple(h);
                default:
                    throw error(error_kind::malformed, fmt::format("unsupported major type: {}", h.type));
            }
        }
    private:
        const buffer _data;
        size_t _pos;
        const decode_options &_opts;

        buffer _remaining() const noexcept
        {
            return buffer { _data.data() + _pos, _data.size() - _pos };
        }

        buffer _read_data(const uint64_t sz)
        {
            if (sz > _data.size() - _pos) [[unlikely]]
                throw error(error_kind::malformed, fmt::format("a string of {} bytes at offset {} extends beyond the end of data", sz, _pos));
            const buffer res { _data.data() + _pos, static_cast<size_t>(sz) };
            _pos += res.size();
            return res;
        }

        value _read_array(const uint64_t num_items, const size_t depth)
        {
            // each item takes at least one byte
            if (num_items > _data.size() - _pos) [[unlikely]]
                throw error(error_kind::malformed, fmt::format("an array of {} items at offset {} extends beyond the end of data", num_items, _pos));
            array_type items {};
            items.reserve(num_items);
            for (uint64_t i = 0; i < num_items; ++i)
                items.emplace_back(read(depth + 1));
            return value::from_array(std::move(items));
        }

        value _read_map(const uint64_t num_pairs, const size_t depth)
        {
            if (num_pairs > (_data.size() - _pos) / 2) [[unlikely]]
                throw error(error_kind::malformed, fmt::format("a map of {} pairs at offset {} extends beyond the end of data", num_pairs, _pos));
            map_type items {};
            items.reserve(num_pairs);
            for (uint64_t i = 0; i < num_pairs; ++i) {
                auto key = read(depth + 1);
                auto val = read(depth + 1);
                items.emplace_back(std::move(key), std::move(val));
            }
            return value::from_map(std::move(items));
        }

        static value _read_simple(const head &h)
        {
            switch (h.ai) {
                case static_cast<uint8_t>(special_val::s_false):
                case static_cast<uint8_t>(special_val::s_true):
                case static_cast<uint8_t>(special_val::s_null):
                case static_cast<uint8_t>(special_val::s_undefined):
                    return value::from_simple(h.ai);
                case static_cast<uint8_t>(special_val::one_byte):
                    if (h.arg < min_extended_simple) [[unlikely]]
                        throw error(error_kind::reserved_simple_value, fmt::format("simple value {} uses the two-byte form", h.arg));
                    return value::from_simple(static_cast<uint8_t>(h.arg));
                case static_cast<uint8_t>(special_val::two_bytes):
                    return value::from_float(float_item { float_width::f16, h.arg });
                case static_cast<uint8_t>(special_val::four_bytes):
                    return value::from_float(float_item { float_width::f32, h.arg });
                case static_cast<uint8_t>(special_val::eight_bytes):
                    return value::from_float(float_item { float_width::f64, h.arg });
                default:
                    throw error(error_kind::unassigned, fmt::format("simple value {} is unassigned", h.ai));
            }
        }
    };
    }

    value decode_item(const buffer data, size_t &offset, const decode_options &opts)
    {
        if (offset > data.size()) [[unlikely]]
            throw error(error_kind::malformed, fmt::format("offset {} is beyond the end of data of {} bytes", offset, data.size()));
        try {
            decoder dec { data, offset, opts };
            auto v = dec.read(0);
            offset = dec.pos();
            return v;
        } catch (const std::bad_alloc &) {
            throw error(error_kind::out_of_memory);
        }
    }

    value decode(const buffer data, const decode_options &opts)
    {
        size_t offset = 0;
        auto v = decode_item(data, offset, opts);
        if (offset != data.size()) [[unlikely]]
            throw error(error_kind::malformed, fmt::format("{} trailing bytes after the data item", data.size() - offset));
        return v;
    }
}

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/cbor/builder.hpp>
#include <ct/cbor/validator.hpp>
#include <ct/logger.hpp>

namespace ctap_turbo::cbor {
    builder::builder(const frame_type initial)
    {
        _frames.emplace_back(frame_type::root);
        if (initial != frame_type::root)
            _frames.emplace_back(initial);
    }

    template<typename T>
    builder &builder::_run(const T &action)
    {
        if (_frames.empty()) [[unlikely]]
            throw error(error_kind::invalid_state);
        try {
            action();
        } catch (const std::bad_alloc &) {
            _unwind();
            throw error(error_kind::out_of_memory);
        } catch (...) {
            _unwind();
            throw;
        }
        return *this;
    }

    builder::frame &builder::_top()
    {
        return _frames.back();
    }

    void builder::_unwind()
    {
        logger::trace("cbor builder: releasing {} frames after a failure", _frames.size());
        _frames.clear();
        _frames.shrink_to_fit();
    }

    void builder::_check_complete(const frame &f)
    {
        if (f.pending_tag) [[unlikely]]
            throw error(error_kind::malformed, fmt::format("a tag in the {} frame has no content", f.type));
    }

    void builder::_leave()
    {
        auto &child = _top();
        _check_complete(child);
        switch (child.type) {
            case frame_type::root:
                throw error(error_kind::empty_stack);
            case frame_type::map:
                if (child.count % 2 != 0) [[unlikely]]
                    throw error(error_kind::invalid_pair_count, fmt::format("a map frame with an odd number of items: {}", child.count));
                break;
            default:
                break;
        }
        auto &parent = _frames[_frames.size() - 2];
        if (child.type == frame_type::map)
            parent.enc.map(child.count / 2);
        else
            parent.enc.array(child.count);
        parent.enc << child.enc;
        parent.add_item();
        _frames.pop_back();
    }

    builder &builder::push_int(const int_type &val)
    {
        return _run([&] {
            auto &f = _top();
            f.enc.integer(val);
            f.add_item();
        });
    }

    builder &builder::push_bytes(const buffer bytes)
    {
        return _run([&] {
            auto &f = _top();
            f.enc.bytes(bytes);
            f.add_item();
        });
    }

    builder &builder::push_text(const std::string_view text)
    {
        return _run([&] {
            auto &f = _top();
            f.enc.text(text);
            f.add_item();
        });
    }

    builder &builder::push_simple(const uint8_t code)
    {
        return _run([&] {
            auto &f = _top();
            f.enc.simple(code);
            f.add_item();
        });
    }

    builder &builder::push_bool(const bool val)
    {
        return push_simple(static_cast<uint8_t>(val ? special_val::s_true : special_val::s_false));
    }

    builder &builder::push_null()
    {
        return push_simple(static_cast<uint8_t>(special_val::s_null));
    }

    builder &builder::push_undefined()
    {
        return push_simple(static_cast<uint8_t>(special_val::s_undefined));
    }

    builder &builder::push_float16(const uint16_t bits)
    {
        return _run([&] {
            auto &f = _top();
            f.enc.float16(bits);
            f.add_item();
        });
    }

    builder &builder::push_float32(const float val)
    {
        return _run([&] {
            auto &f = _top();
            f.enc.float32(val);
            f.add_item();
        });
    }

    builder &builder::push_float64(const double val)
    {
        return _run([&] {
            auto &f = _top();
            f.enc.float64(val);
            f.add_item();
        });
    }

    builder &builder::push_cbor(const buffer fragment)
    {
        return _run([&] {
            if (!validate(fragment)) [[unlikely]]
                throw error(error_kind::malformed_cbor, fmt::format("not a well-formed CBOR fragment: {}", fragment));
            auto &f = _top();
            f.enc.raw_cbor(fragment);
            f.add_item();
        });
    }

    builder &builder::push_tag(const uint64_t number)
    {
        return _run([&] {
            auto &f = _top();
            f.enc.tag(number);
            f.pending_tag = true;
        });
    }

    builder &builder::enter(const frame_type typ)
    {
        return _run([&] {
            if (typ == frame_type::root) [[unlikely]]
                throw error(error_kind::invalid_container_type);
            _frames.emplace_back(typ);
        });
    }

    builder &builder::leave()
    {
        return _run([&] {
            _leave();
        });
    }

    uint8_vector builder::finish()
    {
        _run([&] {
            while (_frames.size() > 1)
                _leave();
            _check_complete(_top());
        });
        auto res = std::move(_top().enc.cbor());
        _frames.clear();
        return res;
    }
}

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CTAP_TURBO_CBOR_BUILDER_HPP
#define CTAP_TURBO_CBOR_BUILDER_HPP

#include <vector>
#include <ct/cbor/encoder.hpp>

namespace ctap_turbo::cbor {
    enum class frame_type: uint8_t {
        root,
        array,
        map
    };

    /*
     * Produces canonical CBOR incrementally without building a tree.
     * Items are appended to the innermost open container. The caller is responsible
     * for pushing map pairs in the canonical key order.
     * After any failure the builder releases its frames and every later call throws invalid_state.
     */
    struct builder {
        explicit builder(frame_type initial=frame_type::root);

        builder &push_int(const int_type &val);
        builder &push_bytes(buffer bytes);
        builder &push_text(std::string_view text);
        builder &push_simple(uint8_t code);
        builder &push_bool(bool val);
        builder &push_null();
        builder &push_undefined();
        builder &push_float16(uint16_t bits);
        builder &push_float32(float val);
        builder &push_float64(double val);
        // appends an already encoded data item, which must be well-formed
        builder &push_cbor(buffer fragment);
        // the tag applies to the item pushed next and does not count as an item by itself
        builder &push_tag(uint64_t number);
        builder &enter(frame_type typ);
        builder &leave();
        // closes every open container and returns the encoded data
        uint8_vector finish();

        size_t depth() const noexcept
        {
            return _frames.size();
        }

        bool valid() const noexcept
        {
            return !_frames.empty();
        }
    private:
        struct frame {
            explicit frame(const frame_type typ): type { typ }
            {
            }

            frame_type type;
            encoder enc {};
            uint64_t count = 0;
            // a tag head has been written and its content is still missing
            bool pending_tag = false;

            void add_item() noexcept
            {
                ++count;
                pending_tag = false;
            }
        };

        std::vector<frame> _frames {};

        template<typename T>
        builder &_run(const T &action);
        frame &_top();
        static void _check_complete(const frame &f);
        void _leave();
        void _unwind();
    };
}

namespace fmt {
    template<>
    struct formatter<ctap_turbo::cbor::frame_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ctap_turbo::cbor::frame_type;
            switch (v) {
                case frame_type::root: return fmt::format_to(ctx.out(), "root");
                case frame_type::array: return fmt::format_to(ctx.out(), "array");
                case frame_type::map: return fmt::format_to(ctx.out(), "map");
                default: return fmt::format_to(ctx.out(), "frame_type: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !CTAP_TURBO_CBOR_BUILDER_HPP

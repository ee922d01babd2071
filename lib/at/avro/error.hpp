/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef AVRO_TURBO_AVRO_ERROR_HPP
#define AVRO_TURBO_AVRO_ERROR_HPP

#include <cstdint>
#include <at/common/error.hpp>
#include <at/common/format.hpp>

namespace avro_turbo::avro {
    enum class decode_errc {
        end_of_input,
        int_overflow,
        long_overflow,
        invalid_length,
        invalid_bool
    };

    // The base of all failures of the read operations.
    // position() is the offset of the value that failed to decode.
    struct decode_error: error {
        decode_error(const decode_errc code, const size_t pos, const std::string_view msg):
            error { msg }, _code { code }, _pos { pos }
        {
        }

        decode_errc code() const noexcept
        {
            return _code;
        }

        size_t position() const noexcept
        {
            return _pos;
        }
    private:
        decode_errc _code;
        size_t _pos;
    };

    struct end_of_input_error: decode_error {
        end_of_input_error(const size_t pos, const size_t required, const size_t size):
            decode_error { decode_errc::end_of_input, pos,
                fmt::format("end of input: {} bytes requested at position {} of a {}-byte buffer", required, pos, size) }
        {
        }
    };

    struct varint_overflow_error: decode_error {
        varint_overflow_error(const decode_errc code, const size_t pos, const size_t max_bytes):
            decode_error { code, pos,
                fmt::format("{}: a variable-length integer at position {} is longer than {} bytes",
                    code == decode_errc::int_overflow ? "int overflow" : "long overflow", pos, max_bytes) }
        {
        }
    };

    struct invalid_length_error: decode_error {
        invalid_length_error(const size_t pos, const int64_t length):
            decode_error { decode_errc::invalid_length, pos,
                fmt::format("invalid length {} at position {}", length, pos) }
        {
        }
    };

    // The byte has been consumed; value() holds what a lenient reader would use.
    struct invalid_bool_error: decode_error {
        invalid_bool_error(const size_t pos, const uint8_t byte):
            decode_error { decode_errc::invalid_bool, pos,
                fmt::format("invalid boolean byte 0x{:02X} at position {}", byte, pos) },
            _byte { byte }
        {
        }

        bool value() const noexcept
        {
            return _byte == 1;
        }

        uint8_t byte() const noexcept
        {
            return _byte;
        }
    private:
        uint8_t _byte;
    };
}

namespace fmt {
    template<>
    struct formatter<avro_turbo::avro::decode_errc>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using avro_turbo::avro::decode_errc;
            switch (v) {
                case decode_errc::end_of_input: return fmt::format_to(ctx.out(), "end_of_input");
                case decode_errc::int_overflow: return fmt::format_to(ctx.out(), "int_overflow");
                case decode_errc::long_overflow: return fmt::format_to(ctx.out(), "long_overflow");
                case decode_errc::invalid_length: return fmt::format_to(ctx.out(), "invalid_length");
                case decode_errc::invalid_bool: return fmt::format_to(ctx.out(), "invalid_bool");
                default: return fmt::format_to(ctx.out(), "decode_errc::{}", static_cast<int>(v));
            }
        }
    };
}

#endif // !AVRO_TURBO_AVRO_ERROR_HPP

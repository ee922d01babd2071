/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

/*
 * Avro ints and longs are zigzag-mapped and then written as base-128 varints:
 * the low 7 bits of every byte carry data, least significant group first,
 * and the high bit marks that another byte follows.
 * The code is defined in a single header to benefit from inlining into the decoder's hot paths.
 */
#ifndef AVRO_TURBO_AVRO_VARINT_HPP
#define AVRO_TURBO_AVRO_VARINT_HPP

#include <concepts>
#include <cstdint>
#include <type_traits>
#include <at/common/bytes.hpp>
#include <at/avro/error.hpp>

namespace avro_turbo::avro {
    static constexpr size_t max_int_bytes = 5;
    static constexpr size_t max_long_bytes = 10;

    template<typename T>
    concept varint_value = std::same_as<T, int32_t> || std::same_as<T, int64_t>;

    template<varint_value T>
    constexpr size_t max_varint_bytes() noexcept
    {
        if constexpr (std::is_same_v<T, int32_t>)
            return max_int_bytes;
        else
            return max_long_bytes;
    }

    template<varint_value T>
    constexpr decode_errc varint_overflow_code() noexcept
    {
        if constexpr (std::is_same_v<T, int32_t>)
            return decode_errc::int_overflow;
        else
            return decode_errc::long_overflow;
    }

    constexpr bool has_bytes(const size_t size, const size_t pos, const size_t required) noexcept
    {
        return pos <= size && required <= size - pos;
    }

    template<varint_value T>
    constexpr std::make_unsigned_t<T> zigzag_encode(const T val) noexcept
    {
        using U = std::make_unsigned_t<T>;
        return (static_cast<U>(val) << 1) ^ static_cast<U>(val >> (sizeof(T) * 8 - 1));
    }

    template<varint_value T>
    constexpr T zigzag_decode(const std::make_unsigned_t<T> val) noexcept
    {
        using U = std::make_unsigned_t<T>;
        return static_cast<T>((val >> 1) ^ (U { 0 } - (val & 1)));
    }

    template<varint_value T>
    void varint_encode(uint8_vector &out, const T val)
    {
        auto u = zigzag_encode(val);
        while (u > 0x7F) {
            out << static_cast<uint8_t>((u & 0x7F) | 0x80);
            u >>= 7;
        }
        out << static_cast<uint8_t>(u);
    }

    template<varint_value T>
    uint8_vector varint_encode(const T val)
    {
        uint8_vector out {};
        varint_encode(out, val);
        return out;
    }

    // Decodes a varint starting at pos and moves pos past it.
    // On failure pos is left unchanged.
    template<varint_value T>
    T varint_decode(const buffer data, size_t &pos)
    {
        using U = std::make_unsigned_t<T>;
        if (!has_bytes(data.size(), pos, 1)) [[unlikely]]
            throw end_of_input_error(pos, 1, data.size());
        U val = 0;
        size_t next = pos;
        for (size_t num_bytes = 0; ; ++num_bytes) {
            if (num_bytes == max_varint_bytes<T>()) [[unlikely]]
                throw varint_overflow_error(varint_overflow_code<T>(), pos, max_varint_bytes<T>());
            if (next >= data.size()) [[unlikely]]
                throw end_of_input_error(pos, num_bytes + 1, data.size());
            const uint8_t b = data[next++];
            val |= static_cast<U>(b & 0x7F) << (7 * num_bytes);
            if (!(b & 0x80))
                break;
        }
        pos = next;
        return zigzag_decode<T>(val);
    }
}

#endif // !AVRO_TURBO_AVRO_VARINT_HPP

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <bit>
#include <cstring>
#include <limits>
#include <type_traits>
#include <at/avro/decoder.hpp>
#include <at/logger.hpp>

namespace avro_turbo::avro {
    bool binary_decoder::read_boolean()
    {
        if (!has_bytes(_buf.size(), _pos, 1)) [[unlikely]]
            throw end_of_input_error(_pos, 1, _buf.size());
        const auto pos = _pos;
        const uint8_t b = _buf[_pos++];
        if (b > 1) [[unlikely]]
            throw invalid_bool_error(pos, b);
        return b == 1;
    }

    int32_t binary_decoder::read_int()
    {
        return varint_decode<int32_t>(_buf, _pos);
    }

    int64_t binary_decoder::read_long()
    {
        return varint_decode<int64_t>(_buf, _pos);
    }

    template<typename T>
    T binary_decoder::_read_little_endian()
    {
        static_assert(std::numeric_limits<T>::is_iec559);
        if (!has_bytes(_buf.size(), _pos, sizeof(T))) [[unlikely]]
            throw end_of_input_error(_pos, sizeof(T), _buf.size());
        using U = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
        static_assert(sizeof(U) == sizeof(T));
        U bits;
        memcpy(&bits, _buf.data() + _pos, sizeof(bits));
        _pos += sizeof(bits);
        return std::bit_cast<T>(little_to_host(bits));
    }

    float binary_decoder::read_float()
    {
        return _read_little_endian<float>();
    }

    double binary_decoder::read_double()
    {
        return _read_little_endian<double>();
    }

    uint8_vector binary_decoder::read_bytes()
    {
        size_t pos = _pos;
        const auto len = varint_decode<int64_t>(_buf, pos);
        if (len < 0) [[unlikely]]
            throw invalid_length_error(_pos, len);
        const auto sz = static_cast<uint64_t>(len);
        if (sz > _buf.size() || !has_bytes(_buf.size(), pos, static_cast<size_t>(sz))) [[unlikely]]
            throw end_of_input_error(_pos, pos - _pos + sz, _buf.size());
        uint8_vector res(_buf.subbuf(pos, static_cast<size_t>(sz)));
        _pos = pos + static_cast<size_t>(sz);
        return res;
    }

    // strings carry a 32-bit length prefix unlike the 64-bit one of bytes
    std::string binary_decoder::read_string()
    {
        size_t pos = _pos;
        const auto len = varint_decode<int32_t>(_buf, pos);
        if (len < 0) [[unlikely]]
            throw invalid_length_error(_pos, len);
        const auto sz = static_cast<size_t>(len);
        if (!has_bytes(_buf.size(), pos, sz)) [[unlikely]]
            throw end_of_input_error(_pos, pos - _pos + sz, _buf.size());
        std::string res(reinterpret_cast<const char *>(_buf.data() + pos), sz);
        _pos = pos + sz;
        return res;
    }

    int64_t binary_decoder::_read_item_count()
    {
        size_t pos = _pos;
        auto count = varint_decode<int64_t>(_buf, pos);
        if (count < 0) {
            if (count == std::numeric_limits<int64_t>::min()) [[unlikely]]
                throw invalid_length_error(_pos, count);
            count = -count;
            // the byte size of the block lets skipping readers jump over it, items are decoded one by one here
            [[maybe_unused]] const auto block_size = varint_decode<int64_t>(_buf, pos);
        }
        _pos = pos;
        return count;
    }

    void binary_decoder::read_fixed(write_buffer dst, const size_t start, const int64_t length)
    {
        if (length < 0) [[unlikely]]
            throw invalid_length_error(_pos, length);
        const auto sz = static_cast<size_t>(length);
        if (!has_bytes(_buf.size(), _pos, start) || !has_bytes(_buf.size(), _pos + start, sz)) [[unlikely]]
            throw end_of_input_error(_pos, start + sz, _buf.size());
        if (dst.size() < sz) [[unlikely]]
            throw error(fmt::format("a fixed of {} bytes does not fit a destination of {} bytes", sz, dst.size()));
        // start skips input bytes after the cursor, the cursor itself advances only by length
        if (sz)
            memcpy(dst.data(), _buf.data() + _pos + start, sz);
        _pos += sz;
    }

    void binary_decoder::set_block(data_block &&block)
    {
        _block = std::move(block.bytes);
        _buf = _block;
        _pos = 0;
        if (logger::tracing_enabled())
            logger::trace("avro decoder: switched to a block of {} bytes", _buf.size());
    }
}

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef AVRO_TURBO_AVRO_DECODER_HPP
#define AVRO_TURBO_AVRO_DECODER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <at/common/bytes.hpp>
#include <at/avro/error.hpp>
#include <at/avro/varint.hpp>

namespace avro_turbo::avro {
    // One framed chunk of a multi-block stream as produced by a container reader.
    struct data_block {
        uint8_vector bytes {};
    };

    /*
     * The read operations of the Avro encoding in the order the schema dictates.
     * Every read either advances the cursor past the value or throws a decode_error
     * and leaves the cursor untouched. invalid_bool_error is the only exception to that
     * rule since its byte has been read in full.
     *
     * Containers are read in blocks: call read_array_start, read that many items,
     * call array_next, and repeat until a zero count is returned. Maps work the same.
     */
    struct decoder {
        virtual ~decoder() =default;

        virtual std::nullptr_t read_null() =0;
        virtual bool read_boolean() =0;
        virtual int32_t read_int() =0;
        virtual int64_t read_long() =0;
        virtual float read_float() =0;
        virtual double read_double() =0;
        virtual uint8_vector read_bytes() =0;
        virtual std::string read_string() =0;
        virtual int32_t read_enum() =0;
        virtual int64_t read_array_start() =0;
        virtual int64_t array_next() =0;
        virtual int64_t read_map_start() =0;
        virtual int64_t map_next() =0;
        virtual void read_fixed(write_buffer dst) =0;
        virtual void read_fixed(write_buffer dst, size_t start, int64_t length) =0;
        // the block's bytes replace the active buffer and the cursor moves to its start
        virtual void set_block(data_block &&block) =0;
        // positions are not validated until the next read
        virtual void seek(size_t pos) =0;
        virtual size_t tell() const =0;
    };

    struct binary_decoder final: decoder {
        binary_decoder(const binary_decoder &) =delete;

        // data is borrowed and must outlive the decoder or the next set_block call
        explicit binary_decoder(const buffer data={}) noexcept:
            _buf { data }
        {
        }

        explicit binary_decoder(data_block &&block)
        {
            set_block(std::move(block));
        }

        std::nullptr_t read_null() override
        {
            return nullptr;
        }

        bool read_boolean() override;
        int32_t read_int() override;
        int64_t read_long() override;
        float read_float() override;
        double read_double() override;
        uint8_vector read_bytes() override;
        std::string read_string() override;

        int32_t read_enum() override
        {
            return read_int();
        }

        int64_t read_array_start() override
        {
            return _read_item_count();
        }

        int64_t array_next() override
        {
            return _read_item_count();
        }

        int64_t read_map_start() override
        {
            return _read_item_count();
        }

        int64_t map_next() override
        {
            return _read_item_count();
        }

        void read_fixed(write_buffer dst) override
        {
            read_fixed(dst, 0, static_cast<int64_t>(dst.size()));
        }

        void read_fixed(write_buffer dst, size_t start, int64_t length) override;
        void set_block(data_block &&block) override;

        void seek(const size_t pos) override
        {
            _pos = pos;
        }

        size_t tell() const override
        {
            return _pos;
        }

        size_t remaining() const noexcept
        {
            return _pos < _buf.size() ? _buf.size() - _pos : 0;
        }

        bool done() const noexcept
        {
            return remaining() == 0;
        }
    private:
        uint8_vector _block {};
        buffer _buf {};
        size_t _pos = 0;

        template<typename T>
        T _read_little_endian();
        int64_t _read_item_count();
    };
}

#endif // !AVRO_TURBO_AVRO_DECODER_HPP

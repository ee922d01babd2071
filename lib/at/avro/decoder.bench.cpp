/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <random>
#include <at/benchmark.hpp>
#include <at/avro/decoder.hpp>

using namespace avro_turbo;
using namespace avro_turbo::avro;

namespace {
    uint8_vector random_longs(const size_t num_items)
    {
        std::default_random_engine rnd { 42 };
        std::uniform_int_distribution<int> bits_dist { 1, 63 };
        uint8_vector data {};
        for (size_t i = 0; i < num_items; ++i) {
            const auto bits = bits_dist(rnd);
            std::uniform_int_distribution<int64_t> val_dist { -(1LL << (bits - 1)), (1LL << (bits - 1)) - 1 };
            varint_encode<int64_t>(data, val_dist(rnd));
        }
        return data;
    }

    uint8_vector random_strings(const size_t num_items)
    {
        std::default_random_engine rnd { 42 };
        std::uniform_int_distribution<int32_t> len_dist { 0, 64 };
        uint8_vector data {};
        for (size_t i = 0; i < num_items; ++i) {
            const auto len = len_dist(rnd);
            varint_encode<int32_t>(data, len);
            for (int32_t j = 0; j < len; ++j)
                data << static_cast<uint8_t>('a' + j % 26);
        }
        return data;
    }
}

suite avro_decoder_bench_suite = [] {
    "avro::binary_decoder"_test = [] {
        static constexpr size_t num_items = 1 << 20;
        const auto longs = random_longs(num_items);
        benchmark("read_long", 100e6, 5, [&longs] {
            binary_decoder dec { longs };
            int64_t sum = 0;
            while (!dec.done())
                sum += dec.read_long();
            expect(sum != 1);
            return longs.size();
        });
        const auto strings = random_strings(num_items);
        benchmark("read_string", 200e6, 5, [&strings] {
            binary_decoder dec { strings };
            size_t total = 0;
            while (!dec.done())
                total += dec.read_string().size();
            expect(total > 0);
            return strings.size();
        });
    };
};

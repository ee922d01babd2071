/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <at/avro/decoder.hpp>

// The first byte of the input selects the read sequence, the rest is the data to decode.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, const size_t size)
{
    using namespace avro_turbo;
    using namespace avro_turbo::avro;
    if (size == 0)
        return 0;
    binary_decoder dec { buffer { data + 1, size - 1 } };
    uint8_t ops = data[0];
    std::array<uint8_t, 16> fixed {};
    try {
        while (!dec.done()) {
            switch (ops & 0x7) {
                case 0: dec.read_int(); break;
                case 1: dec.read_long(); break;
                case 2: dec.read_string(); break;
                case 3: dec.read_bytes(); break;
                case 4: dec.read_double(); break;
                case 5:
                    for (auto cnt = dec.read_array_start(); cnt != 0; cnt = dec.array_next()) {
                        for (int64_t i = 0; i < cnt; ++i)
                            dec.read_float();
                    }
                    break;
                case 6: dec.read_fixed(fixed, ops % fixed.size(), (ops >> 4) % 8); break;
                default: dec.read_boolean(); break;
            }
            ops = static_cast<uint8_t>((ops >> 3) | (ops << 5));
        }
    } catch (const error &) {
        // malformed input and oversized fixed reads fail with the library errors
    }
    return 0;
}

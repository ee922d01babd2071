/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <vector>
#include <at/common/test.hpp>
#include <at/avro/decoder.hpp>

using namespace avro_turbo;
using namespace avro_turbo::avro;

namespace {
    // a failed read must leave the cursor where it was
    template<typename E, typename F>
    void expect_decode_error(const decode_errc code, binary_decoder &dec, const F &f,
        const std::optional<size_t> err_pos={}, const std::source_location &loc=std::source_location::current())
    {
        const auto pos_before = dec.tell();
        try {
            f();
            expect(false, loc) << "no exception has been thrown";
        } catch (const E &ex) {
            test_same(ex.code(), code, loc);
            test_same(ex.position(), err_pos.value_or(pos_before), loc);
        }
        test_same(dec.tell(), pos_before, loc);
    }
}

suite avro_decoder_suite = [] {
    "avro::binary_decoder"_test = [] {
        "int vectors"_test = [] {
            const auto data = uint8_vector::from_hex("000304");
            binary_decoder dec { data };
            test_same(dec.read_int(), 0);
            test_same(dec.tell(), 1);
            test_same(dec.read_int(), -2);
            test_same(dec.read_int(), 2);
            test_same(dec.tell(), 3);
            expect(dec.done());
        };
        "long"_test = [] {
            const auto data = uint8_vector::from_hex("FEFFFFFFFFFFFFFFFF01" "9601");
            binary_decoder dec { data };
            test_same(dec.read_long(), std::numeric_limits<int64_t>::max());
            test_same(dec.read_long(), 75);
            expect(dec.done());
        };
        "int overflow"_test = [] {
            const auto data = uint8_vector::from_hex("8080808080");
            binary_decoder dec { data };
            expect_decode_error<varint_overflow_error>(decode_errc::int_overflow, dec, [&] { dec.read_int(); });
        };
        "long overflow"_test = [] {
            const auto data = uint8_vector::from_hex("80808080808080808080");
            binary_decoder dec { data };
            expect_decode_error<varint_overflow_error>(decode_errc::long_overflow, dec, [&] { dec.read_long(); });
        };
        "varint cut at the end of the buffer"_test = [] {
            const auto data = uint8_vector::from_hex("02FF");
            binary_decoder dec { data };
            test_same(dec.read_int(), 1);
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_int(); });
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_long(); });
        };
        "null"_test = [] {
            binary_decoder dec {};
            expect(dec.read_null() == nullptr);
            test_same(dec.tell(), 0);
        };
        "boolean"_test = [] {
            const auto data = uint8_vector::from_hex("000102");
            binary_decoder dec { data };
            expect(!dec.read_boolean());
            expect(dec.read_boolean());
            try {
                dec.read_boolean();
                expect(false) << "no exception has been thrown";
            } catch (const invalid_bool_error &ex) {
                test_same(ex.code(), decode_errc::invalid_bool);
                expect(!ex.value());
                test_same(ex.byte(), 2);
                test_same(ex.position(), 2);
            }
            // the invalid byte has been consumed
            test_same(dec.tell(), 3);
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_boolean(); });
        };
        "float"_test = [] {
            const auto data = uint8_vector::from_hex("0000803F" "0000C0FF" "000080FF");
            binary_decoder dec { data };
            test_same(dec.read_float(), 1.0F);
            test_same(dec.tell(), 4);
            expect(std::isnan(dec.read_float()));
            test_same(dec.read_float(), -std::numeric_limits<float>::infinity());
        };
        "double"_test = [] {
            const auto data = uint8_vector::from_hex("000000000000F03F" "182D4454FB210940");
            binary_decoder dec { data };
            test_same(dec.read_double(), 1.0);
            test_same(dec.read_double(), 3.141592653589793);
            expect(dec.done());
        };
        "float and double need all their bytes"_test = [] {
            const auto data = uint8_vector::from_hex("0000803F000000");
            binary_decoder dec { data };
            dec.seek(4);
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_float(); });
            dec.seek(0);
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_double(); });
        };
        "string"_test = [] {
            const auto data = uint8_vector::from_hex("06666F6F" "00");
            binary_decoder dec { data };
            test_same(dec.read_string(), std::string { "foo" });
            test_same(dec.tell(), 4);
            test_same(dec.read_string(), std::string {});
            expect(dec.done());
        };
        "string with a negative length"_test = [] {
            const auto data = uint8_vector::from_hex("05666F6F");
            binary_decoder dec { data };
            expect_decode_error<invalid_length_error>(decode_errc::invalid_length, dec, [&] { dec.read_string(); });
        };
        "string longer than the buffer"_test = [] {
            const auto data = uint8_vector::from_hex("08666F6F");
            binary_decoder dec { data };
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_string(); });
        };
        "string length is a 32-bit int"_test = [] {
            // a valid long but more than five varint bytes
            const auto data = uint8_vector::from_hex("808080808001");
            binary_decoder dec { data };
            expect_decode_error<varint_overflow_error>(decode_errc::int_overflow, dec, [&] { dec.read_string(); });
        };
        "bytes"_test = [] {
            const auto data = uint8_vector::from_hex("06DEADBE" "00");
            binary_decoder dec { data };
            test_same(dec.read_bytes(), uint8_vector::from_hex("DEADBE"));
            test_same(dec.read_bytes(), uint8_vector {});
            expect(dec.done());
        };
        "bytes with a negative length"_test = [] {
            const auto data = uint8_vector::from_hex("01DEADBE");
            binary_decoder dec { data };
            expect_decode_error<invalid_length_error>(decode_errc::invalid_length, dec, [&] { dec.read_bytes(); });
        };
        "bytes longer than the buffer"_test = [] {
            const auto data = uint8_vector::from_hex("FEFFFFFFFFFFFFFFFF01DEADBE");
            binary_decoder dec { data };
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_bytes(); });
        };
        "bytes length is a 64-bit long"_test = [] {
            // a padded six-byte length is too long for an int but fine for a long
            const auto data = uint8_vector::from_hex("868080808000" "AABBCC");
            binary_decoder dec { data };
            test_same(dec.read_bytes(), uint8_vector::from_hex("AABBCC"));
        };
        "enum"_test = [] {
            const auto data = uint8_vector::from_hex("0A");
            binary_decoder dec { data };
            test_same(dec.read_enum(), 5);
        };
        "array with positive block counts"_test = [] {
            // [1, 2] [3] end
            const auto data = uint8_vector::from_hex("040204" "0206" "00");
            binary_decoder dec { data };
            std::vector<int32_t> items {};
            for (auto cnt = dec.read_array_start(); cnt != 0; cnt = dec.array_next()) {
                for (int64_t i = 0; i < cnt; ++i)
                    items.emplace_back(dec.read_int());
            }
            test_same(items.size(), 3);
            test_same(items.at(0), 1);
            test_same(items.at(1), 2);
            test_same(items.at(2), 3);
            expect(dec.done());
        };
        "array with a negative block count"_test = [] {
            uint8_vector data {};
            varint_encode<int64_t>(data, -3);
            varint_encode<int64_t>(data, 10);
            binary_decoder dec { data };
            test_same(dec.read_array_start(), 3);
            test_same(dec.tell(), 2);
        };
        "map"_test = [] {
            // {"a": 1, "b": 2} written as one block with its byte size
            const auto data = uint8_vector::from_hex("03" "0C" "026102" "026204" "00");
            binary_decoder dec { data };
            test_same(dec.read_map_start(), 2);
            test_same(dec.read_string(), std::string { "a" });
            test_same(dec.read_int(), 1);
            test_same(dec.read_string(), std::string { "b" });
            test_same(dec.read_int(), 2);
            test_same(dec.map_next(), 0);
            expect(dec.done());
        };
        "block count without its byte size"_test = [] {
            const auto data = uint8_vector::from_hex("05");
            binary_decoder dec { data };
            // the error points at the missing byte size
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_array_start(); }, 1);
        };
        "block count that cannot be negated"_test = [] {
            uint8_vector data {};
            varint_encode<int64_t>(data, std::numeric_limits<int64_t>::min());
            varint_encode<int64_t>(data, 0);
            binary_decoder dec { data };
            expect_decode_error<invalid_length_error>(decode_errc::invalid_length, dec, [&] { dec.map_next(); });
        };
        "fixed"_test = [] {
            const auto data = uint8_vector::from_hex("01020304");
            binary_decoder dec { data };
            std::array<uint8_t, 3> dst {};
            dec.read_fixed(dst);
            test_same(buffer { dst.data(), dst.size() }, static_cast<buffer>(uint8_vector::from_hex("010203")));
            test_same(dec.tell(), 3);
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_fixed(dst); });
        };
        "fixed with bounds"_test = [] {
            const auto data = uint8_vector::from_hex("AABBCCDD");
            binary_decoder dec { data };
            uint8_vector dst(4);
            dec.read_fixed(dst, 1, 2);
            test_same(dst, uint8_vector::from_hex("BBCC0000"));
            test_same(dec.tell(), 2);
            dec.read_fixed(dst, 0, 0);
            test_same(dec.tell(), 2);
        };
        "fixed start skips input bytes but does not move the cursor"_test = [] {
            const auto data = uint8_vector::from_hex("AABBCCDD");
            binary_decoder dec { data };
            uint8_vector dst(2);
            dec.read_fixed(dst, 2, 2);
            test_same(dst, uint8_vector::from_hex("CCDD"));
            test_same(dec.tell(), 2);
            dec.read_fixed(dst, 0, 2);
            test_same(dst, uint8_vector::from_hex("CCDD"));
            expect(dec.done());
        };
        "fixed with a negative length"_test = [] {
            const auto data = uint8_vector::from_hex("AABBCCDD");
            binary_decoder dec { data };
            uint8_vector dst(4);
            expect_decode_error<invalid_length_error>(decode_errc::invalid_length, dec, [&] { dec.read_fixed(dst, 0, -1); });
        };
        "fixed bounds include the start offset"_test = [] {
            const auto data = uint8_vector::from_hex("AABBCCDD");
            binary_decoder dec { data };
            uint8_vector dst(4);
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_fixed(dst, 3, 2); });
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_fixed(dst, 5, 0); });
            dec.seek(1);
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_fixed(dst, 2, 2); });
            dec.read_fixed(dst, 1, 2);
            test_same(dst, uint8_vector::from_hex("CCDD0000"));
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_fixed(dst, 1, 2); });
        };
        "fixed into a small destination"_test = [] {
            const auto data = uint8_vector::from_hex("AABBCCDD");
            binary_decoder dec { data };
            uint8_vector dst(2);
            expect(throws<error>([&] { dec.read_fixed(dst, 1, 3); }));
            test_same(dec.tell(), 0);
        };
        "set_block"_test = [] {
            const auto data = uint8_vector::from_hex("0204");
            binary_decoder dec { data };
            test_same(dec.read_int(), 1);
            test_same(dec.tell(), 1);
            data_block block { uint8_vector::from_hex("06666F6F") };
            dec.set_block(std::move(block));
            test_same(dec.tell(), 0);
            test_same(dec.remaining(), 4);
            test_same(dec.read_string(), std::string { "foo" });
            expect(dec.done());
        };
        "constructed from a block"_test = [] {
            binary_decoder dec { data_block { uint8_vector::from_hex("0A") } };
            test_same(dec.read_int(), 5);
        };
        "seek and tell"_test = [] {
            const auto data = uint8_vector::from_hex("020406");
            binary_decoder dec { data };
            dec.seek(2);
            test_same(dec.tell(), 2);
            test_same(dec.read_int(), 3);
            dec.seek(1);
            test_same(dec.read_int(), 2);
            dec.seek(10);
            test_same(dec.remaining(), 0);
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_int(); });
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_boolean(); });
            uint8_vector dst {};
            expect_decode_error<end_of_input_error>(decode_errc::end_of_input, dec, [&] { dec.read_fixed(dst); });
        };
        "through the abstract interface"_test = [] {
            const auto data = uint8_vector::from_hex("02" "01" "06666F6F");
            std::unique_ptr<decoder> dec = std::make_unique<binary_decoder>(data);
            test_same(dec->read_long(), 1);
            expect(dec->read_boolean());
            test_same(dec->read_string(), std::string { "foo" });
            test_same(dec->tell(), 6);
        };
    };
};

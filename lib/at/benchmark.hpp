/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef AVRO_TURBO_BENCHMARK_HPP
#define AVRO_TURBO_BENCHMARK_HPP

#include <chrono>
#include <cmath>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>
#include <at/common/test.hpp>

namespace avro_turbo {
    template<typename T>
    concept Countable = requires(T a) {
        { a() + 1 };
    };

    inline std::string humanize_rate(const double rate)
    {
        struct scale {
            double norm;
            const char *suffix;
        };
        static const std::vector<scale> scales { { 1e15, "P" }, { 1e12, "T" }, { 1e9, "G" }, { 1e6, "M" }, { 1e3, "K" } };
        const auto abs_rate = std::fabs(rate);
        for (const auto &[norm, suff]: scales) {
            if (abs_rate >= norm)
                return fmt::format("{:.3f}{}", rate / norm, suff);
        }
        return fmt::format("{:.3f}", rate);
    }

    // the action returns the number of bytes it has processed
    template<Countable T>
    double benchmark_throughput(const std::string_view name, const size_t num_iter, const T &action)
    {
        const auto start = std::chrono::high_resolution_clock::now();
        uint64_t total_bytes = 0;
        for (size_t i = 0; i < num_iter; ++i) {
            total_bytes += action();
        }
        const std::chrono::duration<double> duration = std::chrono::high_resolution_clock::now() - start;
        const double rate = static_cast<double>(total_bytes) / duration.count();
        std::clog << fmt::format("[{}] {}bytes/sec, total bytes: {}\n", name, humanize_rate(rate), total_bytes);
        return rate;
    }

    template<Countable T>
    void benchmark(const std::string_view name, const double min_rate, const size_t num_iter, const T &action, const std::source_location &src_loc=std::source_location::current())
    {
        boost::ut::test(name) = [=] {
            const double rate = benchmark_throughput(name, num_iter, action);
            boost::ut::expect(rate >= min_rate, src_loc) << rate << " < " << min_rate;
        };
    }
}

#endif // !AVRO_TURBO_BENCHMARK_HPP

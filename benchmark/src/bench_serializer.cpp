/*
 * Copyright (c) 2026 The RCSV Authors
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_serializer.cpp
 * @brief Google Benchmark suite for RCSV.
 *
 * Benchmarks cover:
 *   - serialize() throughput for scalar records and map-valued records
 *   - deserialize() throughput, string and stream input
 *   - Tokenizer line splitting, with and without quoting
 */

#include <benchmark/benchmark.h>

#include <rcsv/rcsv.h>

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// ============================================================================
// Records
// ============================================================================

namespace {

struct Measurement {
    int32_t                 id = 0;
    double                  x = 0.0;
    double                  y = 0.0;
    double                  z = 0.0;
    std::string             label;
    bool                    flag = false;
    rcsv::DateTime          stamp;
    std::optional<int64_t>  counter;

    static rcsv::FieldList<Measurement> describeSchema() {
        return {
            rcsv::field("id",      &Measurement::id),
            rcsv::field("x",       &Measurement::x),
            rcsv::field("y",       &Measurement::y),
            rcsv::field("z",       &Measurement::z),
            rcsv::field("label",   &Measurement::label),
            rcsv::field("flag",    &Measurement::flag),
            rcsv::field("stamp",   &Measurement::stamp),
            rcsv::field("counter", &Measurement::counter),
        };
    }
};

struct Readings {
    std::string                                 name;
    rcsv::OrderedMap<std::string, double>       values;

    static rcsv::FieldList<Readings> describeSchema() {
        return {
            rcsv::field("name",   &Readings::name),
            rcsv::field("values", &Readings::values),
        };
    }
};

std::vector<Measurement> makeMeasurements(int64_t n) {
    std::vector<Measurement> rows;
    rows.reserve(static_cast<size_t>(n));
    for (int64_t i = 0; i < n; ++i) {
        Measurement m;
        m.id    = static_cast<int32_t>(i);
        m.x     = static_cast<double>(i) * 0.1;
        m.y     = static_cast<double>(i) * 0.2;
        m.z     = static_cast<double>(i) * 0.3;
        m.label = (i % 10 == 0) ? "quoted, label" : "label";
        m.flag  = (i & 1) == 0;
        m.stamp = rcsv::DateTime(2024, 1 + static_cast<int>(i % 12), 1 + static_cast<int>(i % 28), 12, 30, 0);
        if (i % 3 != 0) {
            m.counter = i * 1000;
        }
        rows.push_back(std::move(m));
    }
    return rows;
}

// 16 channels, each row carrying a sliding window of 8
std::vector<Readings> makeReadings(int64_t n) {
    std::vector<Readings> rows;
    rows.reserve(static_cast<size_t>(n));
    for (int64_t i = 0; i < n; ++i) {
        Readings r;
        r.name = "r" + std::to_string(i);
        for (int64_t k = 0; k < 8; ++k) {
            r.values.insert_or_assign("ch" + std::to_string((i + k) % 16), static_cast<double>(i + k));
        }
        rows.push_back(std::move(r));
    }
    return rows;
}

} // namespace

// ============================================================================
// serialize()
// ============================================================================

static void BM_Serialize_Scalar(benchmark::State& state) {
    const auto rows = makeMeasurements(state.range(0));
    size_t bytes = 0;
    for (auto _ : state) {
        std::string csv = rcsv::serialize(rows);
        bytes = csv.size();
        benchmark::DoNotOptimize(csv.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_Serialize_Scalar)->Range(1000, 100000)->Unit(benchmark::kMicrosecond);

static void BM_Serialize_Map(benchmark::State& state) {
    const auto rows = makeReadings(state.range(0));
    for (auto _ : state) {
        std::string csv = rcsv::serialize(rows);
        benchmark::DoNotOptimize(csv.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Serialize_Map)->Range(1000, 100000)->Unit(benchmark::kMicrosecond);

static void BM_Serialize_Stream(benchmark::State& state) {
    const auto rows = makeMeasurements(state.range(0));
    for (auto _ : state) {
        std::ostringstream os;
        rcsv::serialize(rows, os);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Serialize_Stream)->Range(1000, 100000)->Unit(benchmark::kMicrosecond);

// ============================================================================
// deserialize()
// ============================================================================

static void BM_Deserialize_Scalar(benchmark::State& state) {
    const std::string csv = rcsv::serialize(makeMeasurements(state.range(0)));
    for (auto _ : state) {
        int64_t sum = 0;
        for (const Measurement& m : rcsv::deserialize<Measurement>(csv)) {
            sum += m.id;
        }
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(csv.size()));
}
BENCHMARK(BM_Deserialize_Scalar)->Range(1000, 100000)->Unit(benchmark::kMicrosecond);

static void BM_Deserialize_Map(benchmark::State& state) {
    const std::string csv = rcsv::serialize(makeReadings(state.range(0)));
    for (auto _ : state) {
        size_t entries = 0;
        for (const Readings& r : rcsv::deserialize<Readings>(csv)) {
            entries += r.values.size();
        }
        benchmark::DoNotOptimize(entries);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Deserialize_Map)->Range(1000, 100000)->Unit(benchmark::kMicrosecond);

static void BM_Deserialize_Stream(benchmark::State& state) {
    const std::string csv = rcsv::serialize(makeMeasurements(state.range(0)));
    for (auto _ : state) {
        std::istringstream is(csv);
        rcsv::RecordReader<Measurement> reader;
        reader.open(is);
        int64_t count = 0;
        while (reader.readNext()) {
            benchmark::DoNotOptimize(reader.record().x);
            ++count;
        }
        benchmark::DoNotOptimize(count);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Deserialize_Stream)->Range(1000, 100000)->Unit(benchmark::kMicrosecond);

// ============================================================================
// Tokenizer
// ============================================================================

static void BM_ParseLine(benchmark::State& state, std::string line) {
    for (auto _ : state) {
        auto cells = rcsv::parseLine(line, ',');
        benchmark::DoNotOptimize(cells.data());
    }
    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(line.size()));
}
BENCHMARK_CAPTURE(BM_ParseLine, Plain,
                  std::string("42,0.1,0.2,0.3,label,True,2024-01-01 12:30:00,1000"));
BENCHMARK_CAPTURE(BM_ParseLine, Quoted,
                  std::string("42,\"0,1\",\"say \"\"hi\"\"\",0.3,\"a\nb\",True,2024-01-01 12:30:00,"));

// ============================================================================
BENCHMARK_MAIN();

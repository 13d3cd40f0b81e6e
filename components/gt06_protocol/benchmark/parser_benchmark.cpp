// components/gt06_protocol/benchmark/parser_benchmark.cpp
#include <benchmark/benchmark.h>
#include "gt06_protocol/builder.hpp"
#include "gt06_protocol/command.hpp"
#include "gt06_protocol/parser.hpp"

using namespace gt06_protocol;

static LocationReport sampleReport() {
    LocationReport report;
    report.latitude = -23.5505;
    report.longitude = -46.6333;
    report.speedKmh = 60.0;
    report.courseDeg = 270.0;
    return report;
}

// Builder benchmarks
static void BM_BuildLocation(benchmark::State& state) {
    PacketBuilder builder;
    LocationReport report = sampleReport();

    for (auto _ : state) {
        Frame frame = builder.buildLocation(report);
        benchmark::DoNotOptimize(frame);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildLocation);

// Stream parser benchmarks
static void BM_ExtractFrames(benchmark::State& state) {
    PacketBuilder builder;
    std::vector<uint8_t> stream;
    const auto frames = static_cast<size_t>(state.range(0));
    for (size_t i = 0; i < frames; ++i) {
        Frame frame = builder.buildLocation(sampleReport());
        stream.insert(stream.end(), frame.begin(), frame.end());
    }

    Parser parser;
    for (auto _ : state) {
        std::vector<uint8_t> buffer = stream;
        auto packets = parser.extract(buffer);
        benchmark::DoNotOptimize(packets);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(frames));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(stream.size()));
}
BENCHMARK(BM_ExtractFrames)->Range(1, 256);

static void BM_ExtractWithNoise(benchmark::State& state) {
    PacketBuilder builder;
    std::vector<uint8_t> stream;
    for (int i = 0; i < 64; ++i) {
        stream.insert(stream.end(), 7, 0x55);
        Frame frame = builder.buildCommandAck(static_cast<uint16_t>(i + 1));
        stream.insert(stream.end(), frame.begin(), frame.end());
    }

    Parser parser;
    for (auto _ : state) {
        std::vector<uint8_t> buffer = stream;
        std::vector<ParseIssue> issues;
        auto packets = parser.extract(buffer, issues);
        benchmark::DoNotOptimize(packets);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(stream.size()));
}
BENCHMARK(BM_ExtractWithNoise);

static void BM_InterpretCommand(benchmark::State& state) {
    const std::string text = "Relay,1#";
    Bytes payload = {0x0C, 0x00, 0x00, 0x00, 0x00};
    payload.insert(payload.end(), text.begin(), text.end());
    payload.push_back(0x00);
    payload.push_back(0x02);

    for (auto _ : state) {
        Command command = CommandInterpreter::interpret(payload, 1);
        benchmark::DoNotOptimize(command);
    }
}
BENCHMARK(BM_InterpretCommand);

BENCHMARK_MAIN();

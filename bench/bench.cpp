/**
 * @file bench.cpp
 * @brief Encode/decode throughput benchmarks for .bio containers.
 *
 * Builds synthetic recordings in memory, so no input files are needed.
 * Use for relative comparisons between builds only.
 *
 * Usage:
 *   ./build/biofile_bench           # Run with default 20 iterations
 *   ./build/biofile_bench 200       # Run with custom iteration count
 */

#include <biofile/biofile.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

using namespace biofile;

static constexpr int DEFAULT_ITERATIONS = 20;

// seconds of data at the given rates
static Container make_recording(float seconds, float base_rate, float signal_rate,
                                std::size_t channels, ElementType type, bool with_trigger) {
    Container container;

    auto base_samples = static_cast<std::size_t>(seconds * base_rate);
    std::vector<double> timestamps(base_samples);
    std::vector<std::uint32_t> labels(base_samples);
    for (std::size_t i = 0; i < base_samples; ++i) {
        timestamps[i] = static_cast<double>(i) / base_rate;
        labels[i] = static_cast<std::uint32_t>(i / 1000);
    }
    container.set_timestamp(base_rate, timestamps);
    if (with_trigger) {
        container.set_trigger(labels);
    }

    auto samples = static_cast<std::size_t>(seconds * signal_rate);
    SignalMatrix data(type, samples, channels);
    std::uint8_t* bytes = data.data();
    for (std::size_t i = 0; i < data.size_bytes(); ++i) {
        bytes[i] = static_cast<std::uint8_t>((i * 2654435761U) >> 13);
    }
    container.add_signal("signal", signal_rate, std::move(data));
    return container;
}

static void bench_encode(const char* name, const Container& container, int iterations) {
    std::string encoded;

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        std::ostringstream out;
        if (encode(container, out) != Error::Ok) {
            std::printf("%-24s FAIL\n", name);
            return;
        }
        encoded = out.str();
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(encoded.size()) / per_iter_us;

    std::printf("%-24s %10.1f µs/iter  %8.1f MB/s  (%zu bytes)\n",
                name, per_iter_us, throughput_mbps, encoded.size());
}

static void bench_decode(const char* name, const Container& container, int iterations) {
    std::ostringstream out;
    if (encode(container, out) != Error::Ok) {
        std::printf("%-24s FAIL\n", name);
        return;
    }
    const std::string encoded = out.str();

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        std::istringstream in(encoded);
        Container decoded;
        if (decode(in, decoded) != Error::Ok) {
            std::printf("%-24s FAIL\n", name);
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(encoded.size()) / per_iter_us;

    std::printf("%-24s %10.1f µs/iter  %8.1f MB/s  (%zu bytes)\n",
                name, per_iter_us, throughput_mbps, encoded.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("biofile Benchmarks\n");
    std::printf("==================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-24s %16s  %13s  %s\n", "Test", "Time", "Throughput", "Size");
    std::printf("%-24s %16s  %13s  %s\n", "----", "----", "----------", "----");

    // Typical acquisition shapes
    const Container emg = make_recording(60.0F, 500.0F, 4000.0F, 16, ElementType::Int16, true);
    const Container eeg = make_recording(10.0F, 250.0F, 2000.0F, 64, ElementType::Float32, true);
    const Container imu = make_recording(60.0F, 100.0F, 100.0F, 9, ElementType::Float64, false);

    std::printf("\nEncode:\n");
    bench_encode("emg-16ch-int16", emg, iterations);
    bench_encode("eeg-64ch-float32", eeg, iterations);
    bench_encode("imu-9ch-float64", imu, iterations);

    std::printf("\nDecode:\n");
    bench_decode("emg-16ch-int16", emg, iterations);
    bench_decode("eeg-64ch-float32", eeg, iterations);
    bench_decode("imu-9ch-float64", imu, iterations);

    return 0;
}

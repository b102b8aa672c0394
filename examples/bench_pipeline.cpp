// Minimal benchmark: run the local pipeline repeatedly and report time
#include <iostream>
#include <vector>
#include <chrono>
#include <cmath>
#include "../cpp/pulsefuse_core.h"

static std::vector<double> make(double fs, double seconds, double bpm) {
    const size_t n = static_cast<size_t>(fs * seconds);
    std::vector<double> x; x.reserve(n);
    const double f = bpm / 60.0;
    for (size_t i = 0; i < n; ++i) {
        double t = i / fs; x.push_back(18.0 * std::sin(2 * M_PI * f * t) + 128.0);
    }
    return x;
}

int main() {
    const double fs = 30.0; auto sig = make(fs, 60.0, 72.0);
    auto t0 = std::chrono::steady_clock::now();
    pulsefuse::PPGResult last{};
    for (int i = 0; i < 200; ++i) last = pulsefuse::processPPG(sig, fs);
    auto t1 = std::chrono::steady_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    std::cout << "bench_pipeline: 200 runs in " << ms << " ms, last bpm=" << last.heartRate.value_or(0.0) << "\n";
    return 0;
}

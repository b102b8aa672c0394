// Minimal concurrency smoke: run the pipeline on the same input from several threads
#include <iostream>
#include <thread>
#include <atomic>
#include <vector>
#include <cmath>
#include "../cpp/pulsefuse_core.h"

static std::vector<double> make(double fs, double seconds, double bpm) {
    const size_t n = static_cast<size_t>(fs * seconds);
    std::vector<double> x; x.reserve(n);
    double f = bpm / 60.0;
    unsigned s = 1234567u;
    auto rnd = [&](){ s = 1664525u * s + 1013904223u; return ((s>>8)&0xFFFFFF)/double(0xFFFFFF) - 0.5; };
    for (size_t i = 0; i < n; ++i) {
        double t = i / fs;
        x.push_back(18.0 * std::sin(2 * M_PI * f * t) + 0.5 * rnd() + 128.0);
    }
    return x;
}

static bool same(const pulsefuse::PPGResult& a, const pulsefuse::PPGResult& b) {
    return a.success == b.success && a.heartRate == b.heartRate &&
           a.heartRateVariability == b.heartRateVariability &&
           a.respiratoryRate == b.respiratoryRate &&
           a.signalQuality == b.signalQuality && a.error == b.error;
}

int main() {
    const double fs = 14.0;
    const auto sig = make(fs, 60.0, 72.0);
    const auto reference = pulsefuse::processPPG(sig, fs);

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < 8; ++w) {
        workers.emplace_back([&]{
            for (int i = 0; i < 25; ++i) {
                auto r = pulsefuse::processPPG(sig, fs);
                if (!same(r, reference)) ++mismatches;
            }
        });
    }
    for (auto& t : workers) t.join();

    bool ok = reference.success && mismatches.load() == 0;
    std::cout << (ok ? "OK" : "FAIL") << ": bpm=" << reference.heartRate.value_or(0.0)
              << " mismatches=" << mismatches.load() << "\n";
    return ok ? 0 : 1;
}

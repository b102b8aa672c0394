// Compare two analyses on slightly different signals
#include <iostream>
#include <vector>
#include <cmath>
#include "../cpp/pulsefuse_core.h"

static std::vector<double> make(double fs, double seconds, double bpm, double noise=0.0) {
    const size_t n = static_cast<size_t>(fs * seconds);
    std::vector<double> x; x.reserve(n);
    const double f = bpm / 60.0;
    unsigned s = 12345;
    auto rnd = [&](){ s = 1664525u * s + 1013904223u; return ((s >> 8) & 0xFFFFFF) / double(0xFFFFFF) - 0.5; };
    for (size_t i = 0; i < n; ++i) {
        double t = i / fs;
        double v = 18.0 * std::sin(2 * M_PI * f * t) + noise * rnd() + 128.0;
        x.push_back(v);
    }
    return x;
}

int main() {
    auto a = pulsefuse::processPPG(make(14, 30, 72, 0.5), 14);
    auto b = pulsefuse::processPPG(make(14, 30, 90, 1.0), 14);
    double ha = a.heartRate.value_or(0.0), hb = b.heartRate.value_or(0.0);
    std::cout << "A bpm=" << ha << " B bpm=" << hb << " diff=" << (hb - ha) << "\n";
    return 0;
}

// Minimal example: analyze a synthetic 14 fps camera PPG and print the vitals
#include <iostream>
#include <vector>
#include <cmath>
#include "../cpp/pulsefuse_core.h"

static std::vector<double> make_camera_ppg(double fs, double seconds, double bpm = 72.0) {
    const size_t n = static_cast<size_t>(fs * seconds);
    std::vector<double> x; x.reserve(n);
    const double f = bpm / 60.0;
    for (size_t i = 0; i < n; ++i) {
        double t = i / fs;
        double v = 18.0 * std::sin(2 * M_PI * f * t)
                 + 4.0 * std::sin(2 * M_PI * 0.1 * t)
                 + 128.0; // mid-scale red channel average
        x.push_back(v);
    }
    return x;
}

int main() {
    double fs = 14.0;
    double seconds = 30.0;
    auto signal = make_camera_ppg(fs, seconds, 72.0);
    auto res = pulsefuse::processPPG(signal, fs);
    if (!res.success) {
        std::cout << "failed: " << res.error << "\n";
        return 1;
    }
    std::cout << "BPM: " << *res.heartRate << "\n";
    if (res.heartRateVariability) std::cout << "HRV (RMSSD): " << *res.heartRateVariability << " ms\n";
    if (res.respiratoryRate) std::cout << "Respiratory rate: " << *res.respiratoryRate << " /min\n";
    std::cout << "Quality: " << res.signalQuality << "\n";
    return 0;
}

// Multimodal authentication demo: device match + PPG heart rate against an enrolled baseline
#include <iostream>
#include <vector>
#include <string>
#include <cmath>
#include <cstdlib>
#include "../cpp/pulsefuse_core.h"
#include "../cpp/pulsefuse_fusion.h"

static std::vector<double> make_ppg(double fs, double seconds, double bpm) {
    const size_t n = static_cast<size_t>(fs * seconds);
    std::vector<double> x; x.reserve(n);
    const double f = bpm / 60.0;
    for (size_t i = 0; i < n; ++i) {
        double t = i / fs;
        x.push_back(18.0 * std::sin(2 * M_PI * f * t) + 128.0);
    }
    return x;
}

int main(int argc, char** argv) {
    double bpm = 72.0;
    double enrolled = 70.0;
    bool deviceMatch = true;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--bpm" && i + 1 < argc) { bpm = std::atof(argv[++i]); }
        else if (a == "--enrolled" && i + 1 < argc) { enrolled = std::atof(argv[++i]); }
        else if (a == "--no-device") { deviceMatch = false; }
    }

    const double fs = 14.0;
    auto ppg = pulsefuse::processPPG(make_ppg(fs, 30.0, bpm), fs);

    pulsefuse::BiometricMatch device;
    device.success = deviceMatch;
    device.score = deviceMatch ? 1.0 : 0.0;
    if (!deviceMatch) device.error = "Authentication failed";

    auto res = pulsefuse::authenticateMultimodal(device, ppg, enrolled);
    std::cout << "heartRate=" << res.heartRate.value_or(0.0)
              << " fingerprint=" << res.fingerprintScore
              << " ppg=" << res.ppgScore
              << " quality=" << ppg.signalQuality
              << " fused=" << res.score
              << " -> " << (res.success ? "AUTHENTICATED" : "REJECTED");
    if (!res.error.empty()) std::cout << " (" << res.error << ")";
    std::cout << "\n";
    return res.success ? 0 : 1;
}

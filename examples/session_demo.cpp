// Simple session_demo: stream a synthetic capture into a measurement session, print JSON
#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <cmath>
#include <cstdlib>
#include "../cpp/pulsefuse_session.h"
#include "../cpp/options_validator.h"

static std::vector<float> make_chunk(double fs, double seconds, double bpm, double t0, double noise) {
    const size_t n = static_cast<size_t>(fs * seconds);
    std::vector<float> x; x.reserve(n);
    const double f = bpm / 60.0;
    static unsigned s = 1234567u;
    auto rnd = [&](){ s = 1664525u * s + 1013904223u; return ((s>>8)&0xFFFFFF)/double(0xFFFFFF) - 0.5; };
    for (size_t i = 0; i < n; ++i) {
        double t = t0 + i / fs;
        double v = 18.0 * std::sin(2 * M_PI * f * t)
                 + 4.0 * std::sin(2 * M_PI * 0.1 * t)
                 + noise * rnd()
                 + 128.0;
        x.push_back(static_cast<float>(v));
    }
    return x;
}

static std::string to_json(const pulsefuse::PPGResult& r) {
    std::ostringstream os;
    os << "{";
    os << "\"success\":" << (r.success?"true":"false") << ",";
    os << "\"heartRate\":" << r.heartRate.value_or(0.0) << ",";
    os << "\"heartRateVariability\":" << r.heartRateVariability.value_or(0.0) << ",";
    os << "\"respiratoryRate\":" << r.respiratoryRate.value_or(0.0) << ",";
    os << "\"signalQuality\":" << r.signalQuality;
    if (!r.error.empty()) os << ",\"error\":\"" << r.error << "\"";
    os << "}";
    return os.str();
}

int main(int argc, char** argv) {
    // defaults
    double fs = 14.0;
    double seconds = 60.0;
    double bpm = 72.0;
    double noise = 1.0;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--fs" || a == "-f") && i + 1 < argc) { fs = std::atof(argv[++i]); }
        else if ((a == "--seconds" || a == "-s") && i + 1 < argc) { seconds = std::atof(argv[++i]); }
        else if (a == "--bpm" && i + 1 < argc) { bpm = std::atof(argv[++i]); }
        else if (a == "--noise" && i + 1 < argc) { noise = std::atof(argv[++i]); }
    }

    pulsefuse::Options opt;
    const char* code = nullptr; std::string msg;
    if (!pf_validate_options(fs, opt, &code, &msg)) {
        std::cerr << code << ": " << msg << std::endl;
        return 2;
    }

    pulsefuse::MeasurementSession session(fs, opt);
    session.setTargetSeconds(seconds);

    // one-second chunks, as frames arrive from the camera
    double t = 0.0;
    while (!session.complete()) {
        auto chunk = make_chunk(fs, 1.0, bpm, t, noise);
        session.push(chunk.data(), chunk.size());
        t += 1.0;
        if (static_cast<int>(t) % 10 == 0) {
            std::cerr << "progress=" << session.progress()
                      << " finger=" << (session.fingerDetected() ? "yes" : "no") << "\n";
        }
    }

    std::cout << to_json(session.finish()) << std::endl;
    return 0;
}

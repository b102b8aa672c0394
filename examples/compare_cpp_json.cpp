// Output analysis as compact JSON for a synthetic signal
#include <iostream>
#include <vector>
#include <cmath>
#include <sstream>
#include "../cpp/pulsefuse_core.h"

static std::vector<double> make(double fs, double seconds, double bpm) {
    const size_t n = static_cast<size_t>(fs * seconds);
    std::vector<double> x; x.reserve(n);
    const double f = bpm / 60.0;
    for (size_t i = 0; i < n; ++i) {
        double t = i / fs;
        x.push_back(18.0 * std::sin(2 * M_PI * f * t) + 128.0);
    }
    return x;
}

static std::string to_json(const pulsefuse::PPGResult& r) {
    std::ostringstream os;
    auto opt = [&](const char* k, const std::optional<double>& v){
        os << "\"" << k << "\":";
        if (v) os << *v; else os << "null";
    };
    os << "{";
    os << "\"success\":" << (r.success?"true":"false") << ",";
    opt("heartRate", r.heartRate); os << ",";
    opt("heartRateVariability", r.heartRateVariability); os << ",";
    opt("respiratoryRate", r.respiratoryRate); os << ",";
    os << "\"signalQuality\":" << r.signalQuality << ",";
    os << "\"isEstimate\":" << (r.isEstimate?"true":"false");
    if (!r.error.empty()) os << ",\"error\":\"" << r.error << "\"";
    os << "}";
    return os.str();
}

int main() {
    auto r = pulsefuse::processPPG(make(14, 30, 72), 14);
    std::cout << to_json(r) << "\n";
    return 0;
}

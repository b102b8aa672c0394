// Read intensity samples from a file (optional) and output compact JSON analysis
#include <iostream>
#include <fstream>
#include <vector>
#include <sstream>
#include <cstdlib>
#include <cmath>
#include "../cpp/pulsefuse_core.h"
#include "../cpp/options_validator.h"

static std::vector<double> load_file(const char* path) {
    std::ifstream f(path);
    std::vector<double> v;
    if (!f.good()) return v;
    double x;
    while (f >> x) v.push_back(x);
    return v;
}

static std::vector<double> make(double fs, double seconds, double bpm) {
    const size_t n = static_cast<size_t>(fs * seconds);
    std::vector<double> x; x.reserve(n);
    const double f = bpm / 60.0;
    for (size_t i = 0; i < n; ++i) {
        double t = i / fs; x.push_back(18.0 * std::sin(2 * M_PI * f * t) + 128.0);
    }
    return x;
}

static std::string to_json(const pulsefuse::PPGResult& r) {
    std::ostringstream os;
    os << "{";
    os << "\"success\":" << (r.success?"true":"false") << ",";
    os << "\"heartRate\":" << r.heartRate.value_or(0.0) << ",";
    os << "\"respiratoryRate\":" << r.respiratoryRate.value_or(0.0) << ",";
    os << "\"signalQuality\":" << r.signalQuality;
    os << "}";
    return os.str();
}

int main(int argc, char** argv) {
    const double fs = (argc > 2) ? std::atof(argv[2]) : 14.0;
    pulsefuse::Options opt;
    const char* code = nullptr; std::string msg;
    if (!pf_validate_options(fs, opt, &code, &msg)) {
        std::cerr << code << ": " << msg << std::endl; return 2;
    }
    std::vector<double> x = (argc > 1) ? load_file(argv[1]) : make(fs, 30.0, 72.0);
    if (x.empty()) {
        std::cerr << "No data" << std::endl; return 1;
    }
    auto r = pulsefuse::processPPG(x, fs, opt);
    std::cout << to_json(r) << std::endl;
    return 0;
}

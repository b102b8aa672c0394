// Skewness-based signal quality score
#include <iostream>
#include <vector>
#include <cmath>
#include "../cpp/pulsefuse_core.h"

static int failures = 0;

static void check(const char* name, bool ok) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << name << "\n";
    if (!ok) ++failures;
}

int main() {
    using namespace pulsefuse;

    check("empty input scores 0", scoreQuality({}) == 0.0);
    check("constant input scores 0", scoreQuality(std::vector<double>(100, 0.3)) == 0.0);

    {
        std::vector<double> x(140);
        for (size_t i = 0; i < x.size(); ++i) x[i] = 0.5 + 0.5 * std::sin(2 * M_PI * i / 14.0);
        check("symmetric waveform scores 1", std::fabs(scoreQuality(x) - 1.0) < 1e-9);
    }
    {
        std::vector<double> x(100, 0.0);
        for (size_t i = 0; i < x.size(); i += 10) x[i] = 1.0;
        check("sparse spike train scores 0", scoreQuality(x) == 0.0);
    }
    {
        // symmetric but nearly flat: std below 0.01 halves the score
        std::vector<double> x(100);
        for (size_t i = 0; i < x.size(); ++i) x[i] = 0.5 + 0.001 * std::sin(2 * M_PI * i / 10.0);
        check("near-flat waveform is penalized", std::fabs(scoreQuality(x) - 0.5) < 1e-6);
    }
    {
        // moderate skew lands strictly between 0 and 1
        std::vector<double> x(100);
        for (size_t i = 0; i < x.size(); ++i) {
            double s = std::sin(2 * M_PI * i / 20.0);
            x[i] = s + 0.15 * s * s;
        }
        double q = scoreQuality(x);
        check("partial skew decays linearly", q > 0.0 && q < 1.0);
    }
    {
        std::vector<double> x(60);
        for (size_t i = 0; i < x.size(); ++i) x[i] = std::sin(0.7 * static_cast<double>(i)) * 3.0 + 1.0;
        double q = scoreQuality(x);
        check("score stays within [0,1]", q >= 0.0 && q <= 1.0);
    }

    std::cout << (failures ? "FAIL" : "OK") << ": quality_test (" << failures << " failures)\n";
    return failures ? 1 : 0;
}

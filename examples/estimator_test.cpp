// Heart rate, autocorrelation fallback, HRV and respiratory rate estimators
#include <iostream>
#include <vector>
#include <cmath>
#include "../cpp/pulsefuse_core.h"

static int failures = 0;

static void check(const char* name, bool ok) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << name << "\n";
    if (!ok) ++failures;
}

static std::vector<double> spikes(size_t n, std::initializer_list<int> at) {
    std::vector<double> x(n, 0.0);
    for (int i : at) x[static_cast<size_t>(i)] = 1.0;
    return x;
}

static std::vector<double> sine(double fs, double seconds, double hz, double amp = 0.5, double dc = 0.5) {
    const size_t n = static_cast<size_t>(fs * seconds);
    std::vector<double> x(n);
    for (size_t i = 0; i < n; ++i) x[i] = dc + amp * std::sin(2 * M_PI * hz * i / fs);
    return x;
}

int main() {
    using namespace pulsefuse;
    const double fs = 14.0;

    {
        // peaks every 14 samples at 14 Hz -> 60 bpm
        auto x = spikes(60, {5, 19, 33, 47});
        check("peak spacing gives 60 bpm", std::fabs(estimateHeartRate(x, fs) - 60.0) < 1e-9);
    }
    {
        auto x = spikes(60, {5, 12, 19});
        check("7-sample spacing gives 120 bpm", std::fabs(estimateHeartRate(x, fs) - 120.0) < 1e-9);
    }
    {
        double bpm = estimateHeartRate(std::vector<double>(60, 0.0), fs);
        check("zero-energy input falls back to 60 bpm", std::fabs(bpm - 60.0) < 1e-9);
    }
    {
        // monotone ramp: no peaks, so the autocorrelation path decides
        std::vector<double> x(60);
        for (size_t i = 0; i < x.size(); ++i) x[i] = 0.01 * static_cast<double>(i);
        double bpm = estimateHeartRate(x, fs);
        check("ramp uses autocorrelation within search range", bpm >= 56.0 && bpm <= 120.0);
    }
    {
        auto x = sine(fs, 30.0, 1.2);
        double bpm = estimateHeartRateAutocorr(x, fs);
        // integer lags at 14 Hz: 12 samples (70 bpm) is the closest period to 72 bpm
        check("autocorrelation finds a 72 bpm sine", std::fabs(bpm - 70.0) < 1e-9);
    }
    {
        // too short for any lag with 2p < n
        check("autocorrelation degenerate search space", estimateHeartRateAutocorr({0.2, 0.4, 0.1}, fs) == 60.0);
    }

    check("HRV needs three peaks", !estimateHRV(spikes(40, {5, 15}), fs).has_value());
    {
        // intervals 10 and 12 samples -> 714.29 and 857.14 ms
        auto hrv = estimateHRV(spikes(40, {5, 15, 27}), fs);
        check("HRV is RMSSD of peak intervals", hrv && std::fabs(*hrv - 142.857) < 0.01);
    }
    {
        auto hrv = estimateHRV(spikes(60, {5, 15, 25, 35}), fs);
        check("regular peaks give zero HRV", hrv && *hrv == 0.0);
    }

    {
        auto rr = estimateRespiratoryRate(sine(fs, 60.0, 0.25, 0.4), fs);
        check("15 breaths/min sine", rr && std::fabs(*rr - 15.0) < 1.0);
    }
    check("5 breaths/min rejected", !estimateRespiratoryRate(sine(fs, 60.0, 1.0 / 12.0, 0.4), fs).has_value());
    check("40 breaths/min rejected", !estimateRespiratoryRate(sine(fs, 60.0, 2.0 / 3.0, 0.4), fs).has_value());
    check("flat envelope has no respiration", !estimateRespiratoryRate(std::vector<double>(200, 0.5), fs).has_value());

    std::cout << (failures ? "FAIL" : "OK") << ": estimator_test (" << failures << " failures)\n";
    return failures ? 1 : 0;
}

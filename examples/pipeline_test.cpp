// End-to-end processPPG behavior: validation, bounds, determinism
#include <iostream>
#include <vector>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "../cpp/pulsefuse_core.h"

static int failures = 0;

static void check(const char* name, bool ok) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << name << "\n";
    if (!ok) ++failures;
}

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

static bool same(const pulsefuse::PPGResult& a, const pulsefuse::PPGResult& b) {
    return a.success == b.success && a.heartRate == b.heartRate &&
           a.heartRateVariability == b.heartRateVariability &&
           a.respiratoryRate == b.respiratoryRate &&
           a.signalQuality == b.signalQuality && a.error == b.error;
}

int main() {
    using namespace pulsefuse;
    const double fs = 14.0;

    {
        auto r = processPPG(std::vector<double>(29, 128.0), fs);
        check("fewer than 30 samples rejected", !r.success && r.error == "insufficient signal data" && !r.heartRate);
    }
    {
        auto r = processPPG({}, fs);
        check("empty input rejected", !r.success && r.error == "insufficient signal data" && r.signalQuality == 0.0);
    }
    {
        // length alone decides: a clean 29-sample pulse is still too short
        auto sig = make_ppg(fs, 30.0, 72.0);
        sig.resize(29);
        auto r = processPPG(sig, fs);
        check("29 varying samples rejected", !r.success && r.error == "insufficient signal data");
        sig = make_ppg(fs, 30.0, 72.0);
        sig.resize(30);
        r = processPPG(sig, fs);
        check("30 samples pass validation", r.error != "insufficient signal data" && r.success && r.heartRate.has_value());
    }
    {
        auto r = processPPG(make_ppg(fs, 30.0, 72.0), fs);
        double bpm = r.heartRate.value_or(0.0);
        check("72 bpm recovered within 5 bpm", r.success && std::fabs(bpm - 72.0) <= 5.0);
        check("heart rate is rounded", bpm == std::round(bpm));
        check("clean sine has full quality", r.signalQuality > 0.9);
        check("local result is not an estimate", !r.isEstimate && !r.confidence && r.error.empty());
        check("HRV reported for a long capture", r.heartRateVariability.has_value());
    }
    {
        auto sig = make_ppg(fs, 30.0, 90.0);
        check("identical input gives identical output", same(processPPG(sig, fs), processPPG(sig, fs)));
    }
    {
        // normalization flattens to zeros; autocorrelation falls back to 60 bpm
        auto r = processPPG(std::vector<double>(420, 128.0), fs);
        check("flat signal scores zero quality", r.signalQuality == 0.0);
        check("flat signal reports fallback rate", r.success && r.heartRate && *r.heartRate == 60.0);
        check("flat signal has no respiration", !r.respiratoryRate);
    }

    check("40 bpm inside bounds", checkHeartRateBounds(40.0));
    check("200 bpm inside bounds", checkHeartRateBounds(200.0));
    check("39.9 bpm outside bounds", !checkHeartRateBounds(39.9));
    check("200.1 bpm outside bounds", !checkHeartRateBounds(200.1));
    check("NaN outside bounds", !checkHeartRateBounds(std::numeric_limits<double>::quiet_NaN()));

    {
        auto r = processPPG(make_ppg(fs, 30.0, 30.0), fs);
        check("30 bpm rejected", !r.success && r.error == "heart rate out of normal range" && !r.heartRate);
        check("rejected result still carries quality", r.signalQuality >= 0.0 && r.signalQuality <= 1.0);
    }
    {
        auto r = processPPG(make_ppg(fs, 30.0, 210.0), fs);
        check("210 bpm rejected", !r.success && r.error == "heart rate out of normal range");
    }
    {
        pulsefuse::Options opt;
        opt.bpmMax = 180.0;
        auto r = processPPG(make_ppg(fs, 30.0, 190.0), fs, opt);
        check("custom upper bound applied", !r.success);
    }

    {
        auto sig = make_ppg(fs, 30.0, 72.0);
        for (size_t i = 0; i < sig.size(); i += 10) sig[i] = std::numeric_limits<double>::quiet_NaN();
        auto r = processPPG(sig, fs);
        check("sparse NaN samples are dropped", r.success && r.heartRate.has_value());
    }
    {
        auto sig = make_ppg(fs, 30.0, 72.0);
        for (size_t i = 0; i < sig.size(); i += 4) sig[i] = std::numeric_limits<double>::infinity();
        auto r = processPPG(sig, fs);
        check("mostly invalid signal rejected", !r.success && r.error == "too many invalid signal values");
    }

    {
        bool threw = false;
        try {
            processPPG(make_ppg(fs, 30.0, 72.0), 0.0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check("zero sample rate throws", threw);
    }

    std::cout << (failures ? "FAIL" : "OK") << ": pipeline_test (" << failures << " failures)\n";
    return failures ? 1 : 0;
}

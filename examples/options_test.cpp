// Options validation codes
#include <iostream>
#include <string>
#include <cstring>
#include <limits>
#include "../cpp/options_validator.h"

static int failures = 0;

static void check(const char* name, bool ok) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << name << "\n";
    if (!ok) ++failures;
}

static bool rejects(double fs, const pulsefuse::Options& opt, const char* expected) {
    const char* code = nullptr; std::string msg;
    bool ok = pf_validate_options(fs, opt, &code, &msg);
    return !ok && code && std::strcmp(code, expected) == 0 && !msg.empty();
}

int main() {
    pulsefuse::Options def;
    {
        const char* code = nullptr; std::string msg;
        bool ok = pf_validate_options(14.0, def, &code, &msg);
        check("defaults are valid", ok && code == nullptr && msg.empty());
    }
    check("sample rate below 1 Hz", rejects(0.5, def, "PULSEFUSE_E001"));
    check("NaN sample rate", rejects(std::numeric_limits<double>::quiet_NaN(), def, "PULSEFUSE_E001"));

    { auto o = def; o.minSamples = 2; check("min samples", rejects(14.0, o, "PULSEFUSE_E017")); }
    { auto o = def; o.filterOrderMin = 7; check("filter orders reversed", rejects(14.0, o, "PULSEFUSE_E011")); }
    { auto o = def; o.minHalfWindow = 0; check("filter half window", rejects(14.0, o, "PULSEFUSE_E011")); }
    { auto o = def; o.bpmMin = 210.0; check("bpm range reversed", rejects(14.0, o, "PULSEFUSE_E013")); }
    { auto o = def; o.breathsMax = 90.0; check("respiratory range", rejects(14.0, o, "PULSEFUSE_E014")); }
    { auto o = def; o.ppgWeight = -0.1; check("negative weight", rejects(14.0, o, "PULSEFUSE_E016")); }
    { auto o = def; o.fingerprintWeight = 0.0; o.ppgWeight = 0.0; check("zero weights", rejects(14.0, o, "PULSEFUSE_E016")); }
    { auto o = def; o.remoteMaxPending = 0; check("remote pending limit", rejects(14.0, o, "PULSEFUSE_E018")); }
    { auto o = def; o.remoteTimeoutMs = 0; check("remote timeout", rejects(14.0, o, "PULSEFUSE_E018")); }
    { auto o = def; o.authThreshold = std::numeric_limits<double>::infinity(); check("infinite threshold", rejects(14.0, o, "PULSEFUSE_E015")); }
    check("null outputs are allowed", !pf_validate_options(0.0, def, nullptr, nullptr));

    std::cout << (failures ? "FAIL" : "OK") << ": options_test (" << failures << " failures)\n";
    return failures ? 1 : 0;
}

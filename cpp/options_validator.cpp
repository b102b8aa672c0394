#include "options_validator.h"
#include <cmath>

static inline bool isFinite(double x) {
    return std::isfinite(x) != 0;
}

static inline bool fail(const char* code, const char* msg, const char** err_code, std::string* err_msg) {
    if (err_code) *err_code = code;
    if (err_msg) *err_msg = msg;
    return false;
}

extern "C" bool pf_validate_options(double sampleRate,
                                    const pulsefuse::Options& opt,
                                    const char** err_code,
                                    std::string* err_msg) {
    // sampleRate: 1..1000
    if (!isFinite(sampleRate) || sampleRate < 1.0 || sampleRate > 1000.0) {
        return fail("PULSEFUSE_E001", "Invalid sample rate (1-1000 Hz)", err_code, err_msg);
    }

    // minimum sample count: at least 3 so a peak can have two neighbours
    if (opt.minSamples < 3) {
        return fail("PULSEFUSE_E017", "Invalid minimum sample count (>=3)", err_code, err_msg);
    }

    // filter bank: 1 <= orderMin <= orderMax <= 16, half-window >= 1
    if (opt.filterOrderMin < 1 || opt.filterOrderMax > 16 || opt.filterOrderMin > opt.filterOrderMax || opt.minHalfWindow < 1) {
        return fail("PULSEFUSE_E011", "Invalid filter bank (1<=min<=max<=16, halfWindow>=1)", err_code, err_msg);
    }

    // BPM range: 20 <= bpmMin < bpmMax <= 300
    if (!isFinite(opt.bpmMin) || !isFinite(opt.bpmMax) || opt.bpmMin < 20.0 || opt.bpmMax > 300.0 || !(opt.bpmMin < opt.bpmMax)) {
        return fail("PULSEFUSE_E013", "Invalid BPM range (20<=min<max<=300)", err_code, err_msg);
    }

    // respiratory range: 1 <= min < max <= 60
    if (!isFinite(opt.breathsMin) || !isFinite(opt.breathsMax) || opt.breathsMin < 1.0 || opt.breathsMax > 60.0 || !(opt.breathsMin < opt.breathsMax)) {
        return fail("PULSEFUSE_E014", "Invalid respiratory range (1<=min<max<=60)", err_code, err_msg);
    }

    // fusion weights: finite, non-negative, not both zero
    if (!isFinite(opt.fingerprintWeight) || !isFinite(opt.ppgWeight) || opt.fingerprintWeight < 0.0 || opt.ppgWeight < 0.0 ||
        (opt.fingerprintWeight + opt.ppgWeight) <= 0.0) {
        return fail("PULSEFUSE_E016", "Invalid fusion weights (>=0, sum>0)", err_code, err_msg);
    }

    // remote call limits
    if (opt.remoteTimeoutMs < 1 || opt.remoteMaxPending < 1) {
        return fail("PULSEFUSE_E018", "Invalid remote limits (timeoutMs>=1, maxPending>=1)", err_code, err_msg);
    }

    // Remaining thresholds: reject only if NaN/Inf
    if (!isFinite(opt.minValidFraction) || !isFinite(opt.autocorrMinPeriodSec) || !isFinite(opt.autocorrMaxPeriodSec) ||
        !isFinite(opt.envelopeWindowSec) || !isFinite(opt.skewOnsetPct) || !isFinite(opt.skewZeroPct) ||
        !isFinite(opt.flatStdThreshold) || !isFinite(opt.flatPenalty) || !isFinite(opt.heartRateTolerance) ||
        !isFinite(opt.authThreshold) || !isFinite(opt.remoteConfidenceMin) || !isFinite(opt.sessionSeconds) ||
        !isFinite(opt.sessionMinFraction) || !isFinite(opt.fingerWindowSec) || !isFinite(opt.fingerMinStdDev) ||
        !isFinite(opt.fingerMinRange)) {
        return fail("PULSEFUSE_E015", "Invalid threshold (NaN/Inf)", err_code, err_msg);
    }

    return true;
}

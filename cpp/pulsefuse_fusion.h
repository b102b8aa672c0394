// Multimodal fusion of a device biometric match with a PPG heart-rate match
#pragma once

#include <optional>
#include <string>
#include "pulsefuse_core.h"

namespace pulsefuse {

// Result of the platform biometric prompt (fingerprint / face)
struct BiometricMatch {
    bool success = false;
    double score = 0.0;   // 1.0 on a device match
    std::string error;
};

struct BiometricResult {
    bool success = false;
    double score = 0.0;            // fused confidence 0..1
    double fingerprintScore = 0.0;
    double ppgScore = 0.0;
    std::optional<double> heartRate;
    std::string error;
};

// Weighted fusion; the PPG weight shrinks with ppgQuality and the remainder moves to the
// fingerprint channel. Result clamped to [0,1].
double fuseScores(double fingerprintScore, double ppgScore, double ppgQuality, const Options& opt = {});

// 1.0 within tolerance bpm, linear decay to 0 at 2x tolerance.
double compareHeartRate(double currentHR, double enrolledHR, double tolerance = 10.0);

// Full decision: fused score must exceed opt.authThreshold.
BiometricResult authenticateMultimodal(const BiometricMatch& device,
                                       const PPGResult& ppg,
                                       double enrolledHeartRate,
                                       const Options& opt = {});

} // namespace pulsefuse

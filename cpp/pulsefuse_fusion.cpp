#include "pulsefuse_fusion.h"
#include "pulsefuse_log.h"

#include <algorithm>
#include <cmath>

namespace pulsefuse {

static inline double clamp01(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::max(0.0, std::min(1.0, v));
}

double fuseScores(double fingerprintScore, double ppgScore, double ppgQuality, const Options& opt) {
    const double fp = clamp01(fingerprintScore);
    const double pp = clamp01(ppgScore);
    const double q = clamp01(ppgQuality);
    const double ppgW = opt.ppgWeight * q;
    const double fpW = opt.fingerprintWeight + (opt.ppgWeight - ppgW);
    const double total = fpW + ppgW;
    if (!(total > 0.0)) return 0.0;
    const double fused = (fpW / total) * fp + (ppgW / total) * pp;
    return std::max(0.0, std::min(1.0, fused));
}

double compareHeartRate(double currentHR, double enrolledHR, double tolerance) {
    const double diff = std::fabs(currentHR - enrolledHR);
    if (!std::isfinite(diff)) return 0.0;
    if (tolerance <= 0.0) return diff == 0.0 ? 1.0 : 0.0;
    if (diff <= tolerance) return 1.0;
    return std::max(0.0, 1.0 - (diff - tolerance) / tolerance);
}

BiometricResult authenticateMultimodal(const BiometricMatch& device,
                                       const PPGResult& ppg,
                                       double enrolledHeartRate,
                                       const Options& opt) {
    BiometricResult out;
    out.fingerprintScore = device.success ? clamp01(device.score) : 0.0;
    out.heartRate = ppg.heartRate;
    if (ppg.heartRate) out.ppgScore = compareHeartRate(*ppg.heartRate, enrolledHeartRate, opt.heartRateTolerance);
    const double quality = ppg.success ? ppg.signalQuality : 0.0;
    out.score = fuseScores(out.fingerprintScore, out.ppgScore, quality, opt);
    out.success = out.score > opt.authThreshold;
    if (!out.success) out.error = (!device.success && !device.error.empty()) ? device.error : "authentication failed";
    logger()->debug("authenticateMultimodal: fp={:.2f} ppg={:.2f} q={:.2f} score={:.3f} -> {}",
                    out.fingerprintScore, out.ppgScore, quality, out.score, out.success ? "accept" : "reject");
    return out;
}

} // namespace pulsefuse

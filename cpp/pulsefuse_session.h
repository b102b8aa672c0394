// Measurement session: buffers camera intensity samples until the capture window is full
#pragma once

#include <vector>
#include <cstddef>
#include "pulsefuse_core.h"

namespace pulsefuse {

// Accumulates samples at a nominal sample rate and runs the pipeline once enough were
// captured. Not internally synchronized: one owner pushes and finishes.
class MeasurementSession {
public:
    explicit MeasurementSession(double sampleRate, const Options& opt = {});

    void setTargetSeconds(double sec);              // 60 s by default

    void push(const float* samples, size_t n);
    void push(const std::vector<double>& samples);
    void reset();

    size_t size() const { return signal_.size(); }
    size_t targetSamples() const { return targetSamples_; }
    double sampleRate() const { return sampleRate_; }
    double progress() const;                        // 0..1
    bool complete() const { return signal_.size() >= targetSamples_; }

    // Variation check over the most recent samples (raw intensity scale)
    bool fingerDetected() const;

    // Runs processPPG on the buffer, or fails if less than the minimum fraction was captured
    PPGResult finish() const;

    const std::vector<double>& samples() const { return signal_; }

private:
    double sampleRate_ {14.0};
    Options opt_ {};
    double targetSec_ {60.0};
    size_t targetSamples_ {0};
    std::vector<double> signal_;
};

} // namespace pulsefuse

// Optional plain C bridge (symbols have C linkage; still compiled as C++)
extern "C" {
    void*  pf_session_create(double sampleRate, const pulsefuse::Options* opt);
    void   pf_session_set_target(void* h, double sec);
    void   pf_session_push(void* h, const float* x, size_t n);
    double pf_session_progress(void* h);
    int    pf_session_finish(void* h, pulsefuse::PPGResult* out);
    void   pf_session_destroy(void* h);
}

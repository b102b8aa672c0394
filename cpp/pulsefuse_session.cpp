#include "pulsefuse_session.h"
#include "pulsefuse_log.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace pulsefuse {

MeasurementSession::MeasurementSession(double sampleRate, const Options& opt)
    : sampleRate_(sampleRate), opt_(opt) {
    if (!std::isfinite(sampleRate_) || sampleRate_ <= 0.0) sampleRate_ = 14.0;
    setTargetSeconds(opt_.sessionSeconds);
    signal_.reserve(targetSamples_);
}

void MeasurementSession::setTargetSeconds(double sec) {
    targetSec_ = std::isfinite(sec) ? std::max(1.0, sec) : 60.0;
    targetSamples_ = static_cast<size_t>(std::lround(targetSec_ * sampleRate_));
}

void MeasurementSession::push(const float* x, size_t n) {
    if (!x || n == 0) return;
    signal_.insert(signal_.end(), x, x + n);
}

void MeasurementSession::push(const std::vector<double>& samples) {
    signal_.insert(signal_.end(), samples.begin(), samples.end());
}

void MeasurementSession::reset() {
    signal_.clear();
}

double MeasurementSession::progress() const {
    if (targetSamples_ == 0) return 1.0;
    return std::min(1.0, static_cast<double>(signal_.size()) / static_cast<double>(targetSamples_));
}

bool MeasurementSession::fingerDetected() const {
    const size_t window = std::max<size_t>(1, static_cast<size_t>(std::lround(opt_.fingerWindowSec * sampleRate_)));
    const size_t n = std::min(window, signal_.size());
    if (static_cast<int>(n) < opt_.fingerMinSamples) return false;
    auto first = signal_.end() - static_cast<std::ptrdiff_t>(n);
    double s = 0.0;
    double vmin = std::numeric_limits<double>::infinity();
    double vmax = -std::numeric_limits<double>::infinity();
    size_t count = 0;
    for (auto it = first; it != signal_.end(); ++it) {
        if (!std::isfinite(*it)) continue;
        s += *it; vmin = std::min(vmin, *it); vmax = std::max(vmax, *it); ++count;
    }
    if (static_cast<int>(count) < opt_.fingerMinSamples) return false;
    double m = s / static_cast<double>(count);
    double acc = 0.0;
    for (auto it = first; it != signal_.end(); ++it) {
        if (!std::isfinite(*it)) continue;
        double d = *it - m; acc += d * d;
    }
    double sd = std::sqrt(acc / static_cast<double>(count));
    return sd > opt_.fingerMinStdDev && (vmax - vmin) > opt_.fingerMinRange;
}

PPGResult MeasurementSession::finish() const {
    const double needed = opt_.sessionMinFraction * static_cast<double>(targetSamples_);
    if (static_cast<double>(signal_.size()) < needed) {
        logger()->debug("MeasurementSession: {} of {} samples captured", signal_.size(), targetSamples_);
        PPGResult r;
        r.error = "insufficient frames captured";
        return r;
    }
    return processPPG(signal_, sampleRate_, opt_);
}

} // namespace pulsefuse

// ---- C bridge ----
struct _pf_session_handle { pulsefuse::MeasurementSession* p; };

void* pf_session_create(double sampleRate, const pulsefuse::Options* opt) {
    auto* h = new _pf_session_handle();
    pulsefuse::Options o = opt ? *opt : pulsefuse::Options{};
    h->p = new pulsefuse::MeasurementSession(sampleRate, o);
    return h;
}

void   pf_session_set_target(void* h, double sec) {
    if (!h) return; auto* S = reinterpret_cast<_pf_session_handle*>(h); S->p->setTargetSeconds(sec);
}

void   pf_session_push(void* h, const float* x, size_t n) {
    if (!h) return; auto* S = reinterpret_cast<_pf_session_handle*>(h); S->p->push(x, n);
}

double pf_session_progress(void* h) {
    if (!h) return 0.0; auto* S = reinterpret_cast<_pf_session_handle*>(h); return S->p->progress();
}

int    pf_session_finish(void* h, pulsefuse::PPGResult* out) {
    if (!h || !out) return 0;
    auto* S = reinterpret_cast<_pf_session_handle*>(h);
    *out = S->p->finish();
    return out->success ? 1 : 0;
}

void   pf_session_destroy(void* h) {
    if (!h) return; auto* S = reinterpret_cast<_pf_session_handle*>(h); delete S->p; delete S;
}

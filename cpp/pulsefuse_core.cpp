#include "pulsefuse_core.h"
#include "pulsefuse_log.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace pulsefuse {

namespace {

static inline double clamp(double v, double lo, double hi) {
	return std::max(lo, std::min(hi, v));
}

double mean(const std::vector<double>& v) {
	if (v.empty()) return 0.0;
	double s = std::accumulate(v.begin(), v.end(), 0.0);
	return s / static_cast<double>(v.size());
}

// Mean spacing of consecutive peak indices, in samples
double meanPeakSpacing(const std::vector<int>& peaks) {
	std::vector<double> spacing;
	spacing.reserve(peaks.size());
	for (size_t i = 1; i < peaks.size(); ++i) spacing.push_back(static_cast<double>(peaks[i] - peaks[i - 1]));
	return mean(spacing);
}

} // namespace

std::vector<double> normalizeSignal(const std::vector<double>& signal) {
	if (signal.empty()) return {};
	auto mm = std::minmax_element(signal.begin(), signal.end());
	const double lo = *mm.first;
	double range = *mm.second - lo;
	if (range == 0.0) range = 1.0;
	std::vector<double> out(signal.size());
	for (size_t i = 0; i < signal.size(); ++i) out[i] = (signal[i] - lo) / range;
	return out;
}

std::vector<double> movingAverage(const std::vector<double>& x, int halfWidth) {
	const int n = static_cast<int>(x.size());
	if (halfWidth <= 0 || n == 0) return x;
	std::vector<double> out(n);
	std::vector<double> cumsum(n + 1, 0.0);
	for (int i = 0; i < n; ++i) cumsum[i + 1] = cumsum[i] + x[i];
	for (int i = 0; i < n; ++i) {
		// window clamped at both ends, no padding
		int start = std::max(0, i - halfWidth);
		int end = std::min(n, i + halfWidth + 1);
		out[i] = (cumsum[end] - cumsum[start]) / std::max(1, end - start);
	}
	return out;
}

std::vector<double> filterSignal(const std::vector<double>& signal, double sampleRate, const Options& opt) {
	const size_t n = signal.size();
	if (n == 0) return {};
	const int halfWidth = std::max(opt.minHalfWindow, static_cast<int>(std::floor(sampleRate / 4.0)));
	const int lo = opt.filterOrderMin;
	const int hi = std::max(lo, opt.filterOrderMax);
	std::vector<double> acc(n, 0.0);
	for (int order = lo; order <= hi; ++order) {
		// The order only names the copy; every copy uses the same window.
		std::vector<double> y = movingAverage(signal, halfWidth);
		for (size_t i = 0; i < n; ++i) acc[i] += y[i];
	}
	const double copies = static_cast<double>(hi - lo + 1);
	for (double& v : acc) v /= copies;
	return acc;
}

std::vector<int> detectPeaks(const std::vector<double>& x) {
	const int n = static_cast<int>(x.size());
	std::vector<int> peaks;
	for (int i = 1; i < n - 1; ++i) {
		if (x[i] > x[i - 1] && x[i] > x[i + 1]) peaks.push_back(i);
	}
	return peaks;
}

double estimateHeartRateAutocorr(const std::vector<double>& x, double sampleRate, const Options& opt) {
	const int n = static_cast<int>(x.size());
	double energy = 0.0;
	for (double v : x) energy += v * v;
	if (energy <= 0.0) return 60.0;
	const int minPeriod = std::max(1, static_cast<int>(std::floor(opt.autocorrMinPeriodSec * sampleRate)));
	const int maxPeriod = static_cast<int>(std::floor(opt.autocorrMaxPeriodSec * sampleRate));
	int bestPeriod = -1;
	double bestCorr = -std::numeric_limits<double>::infinity();
	for (int p = minPeriod; p <= maxPeriod && 2 * p < n; ++p) {
		double acc = 0.0;
		for (int i = 0; i + p < n; ++i) acc += x[i] * x[i + p];
		double corr = acc / static_cast<double>(n - p);
		if (corr > bestCorr) {
			bestCorr = corr;
			bestPeriod = p;
		}
	}
	// degenerate search space: assume a 1 s period
	if (bestPeriod <= 0) return 60.0;
	return 60.0 * sampleRate / static_cast<double>(bestPeriod);
}

double estimateHeartRate(const std::vector<double>& filtered, double sampleRate, const Options& opt) {
	std::vector<int> peaks = detectPeaks(filtered);
	if (peaks.size() < 2) {
		logger()->debug("estimateHeartRate: {} peaks, using autocorrelation", peaks.size());
		return estimateHeartRateAutocorr(filtered, sampleRate, opt);
	}
	double periodSec = meanPeakSpacing(peaks) / sampleRate;
	return 60.0 / periodSec;
}

std::optional<double> estimateHRV(const std::vector<double>& filtered, double sampleRate, const Options& opt) {
	std::vector<int> peaks = detectPeaks(filtered);
	if (static_cast<int>(peaks.size()) < std::max(3, opt.hrvMinPeaks)) return std::nullopt;
	std::vector<double> ibiMs;
	ibiMs.reserve(peaks.size() - 1);
	for (size_t i = 1; i < peaks.size(); ++i) ibiMs.push_back((peaks[i] - peaks[i - 1]) * 1000.0 / sampleRate);
	double sumsq = 0.0;
	for (size_t i = 1; i < ibiMs.size(); ++i) {
		double d = ibiMs[i] - ibiMs[i - 1];
		sumsq += d * d;
	}
	return std::sqrt(sumsq / static_cast<double>(ibiMs.size() - 1));
}

std::optional<double> estimateRespiratoryRate(const std::vector<double>& filtered, double sampleRate, const Options& opt) {
	const int window = static_cast<int>(std::lround(opt.envelopeWindowSec * sampleRate));
	std::vector<double> envelope = movingAverage(filtered, std::max(1, window / 2));
	std::vector<int> peaks = detectPeaks(envelope);
	if (peaks.size() < 2) return std::nullopt;
	double periodSec = meanPeakSpacing(peaks) / sampleRate;
	double rate = 60.0 / periodSec;
	// implausible breathing estimates are common; never let them through
	if (rate < opt.breathsMin || rate > opt.breathsMax) {
		logger()->debug("estimateRespiratoryRate: {:.1f} breaths/min rejected", rate);
		return std::nullopt;
	}
	return rate;
}

double scoreQuality(const std::vector<double>& x, const Options& opt) {
	const size_t n = x.size();
	if (n == 0) return 0.0;
	const double m = mean(x);
	double m2 = 0.0, m3 = 0.0;
	for (double v : x) {
		double d = v - m;
		m2 += d * d;
		m3 += d * d * d;
	}
	const double var = m2 / static_cast<double>(n);
	m3 /= static_cast<double>(n);
	// perfectly flat: nothing to score
	if (var <= 0.0) return 0.0;
	const double skewPct = std::fabs(m3 / std::pow(var, 1.5)) * 100.0;
	double quality = 1.0;
	if (skewPct > opt.skewOnsetPct) {
		double span = std::max(1e-9, opt.skewZeroPct - opt.skewOnsetPct);
		quality = std::max(0.0, 1.0 - (skewPct - opt.skewOnsetPct) / span);
	}
	if (std::sqrt(var) < opt.flatStdThreshold) quality *= opt.flatPenalty;
	return clamp(quality, 0.0, 1.0);
}

bool checkHeartRateBounds(double bpm, const Options& opt) {
	return std::isfinite(bpm) && bpm >= opt.bpmMin && bpm <= opt.bpmMax;
}

PPGResult processPPG(const std::vector<double>& signal, double sampleRate, const Options& opt) {
	if (!std::isfinite(sampleRate) || sampleRate <= 0.0) throw std::invalid_argument("sampleRate must be > 0");
	auto lg = logger();
	PPGResult r;
	const size_t minSamples = static_cast<size_t>(std::max(1, opt.minSamples));
	if (signal.size() < minSamples) {
		r.error = "insufficient signal data";
		lg->debug("processPPG: rejected {} samples (< {})", signal.size(), minSamples);
		return r;
	}

	std::vector<double> valid;
	valid.reserve(signal.size());
	for (double v : signal) {
		if (std::isfinite(v)) valid.push_back(v);
	}
	if (static_cast<double>(valid.size()) < opt.minValidFraction * static_cast<double>(signal.size())) {
		r.error = "too many invalid signal values";
		lg->debug("processPPG: {} of {} samples finite", valid.size(), signal.size());
		return r;
	}
	if (valid.size() < minSamples) {
		r.error = "insufficient signal data";
		return r;
	}

	// A flat capture normalizes to zeros and still reports the 60 bpm fallback with quality 0.
	// Callers must gate on signalQuality before trusting heartRate.
	std::vector<double> x = normalizeSignal(valid);
	x = filterSignal(x, sampleRate, opt);
	double bpm = estimateHeartRate(x, sampleRate, opt);
	std::optional<double> hrv = estimateHRV(x, sampleRate, opt);
	std::optional<double> rr = estimateRespiratoryRate(x, sampleRate, opt);
	r.signalQuality = scoreQuality(x, opt);
	lg->debug("processPPG: n={} fs={} bpm={:.2f} quality={:.3f}", x.size(), sampleRate, bpm, r.signalQuality);

	if (!checkHeartRateBounds(bpm, opt)) {
		r.error = "heart rate out of normal range";
		lg->debug("processPPG: {:.2f} bpm outside [{}, {}]", bpm, opt.bpmMin, opt.bpmMax);
		return r;
	}
	r.success = true;
	r.heartRate = std::round(bpm);
	if (hrv) r.heartRateVariability = std::round(*hrv);
	if (rr) r.respiratoryRate = std::round(*rr);
	return r;
}

} // namespace pulsefuse

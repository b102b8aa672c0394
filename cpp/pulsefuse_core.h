#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pulsefuse {

// Pipeline, fusion and session options. Defaults reproduce the reference behavior at 14 fps.
struct Options {
	// Input validation
	int minSamples = 30;             // shorter sequences are rejected before any computation
	double minValidFraction = 0.8;   // fraction of finite samples required after sanitizing

	// Filter bank (moving-average approximations, one copy per nominal order)
	int filterOrderMin = 2;
	int filterOrderMax = 6;
	int minHalfWindow = 3;           // half-width = max(minHalfWindow, floor(fs/4))

	// Heart rate
	double bpmMin = 40.0;            // inclusive plausibility bounds
	double bpmMax = 200.0;
	double autocorrMinPeriodSec = 0.5;
	double autocorrMaxPeriodSec = 1.5;

	// HRV
	int hrvMinPeaks = 3;

	// Respiration
	double envelopeWindowSec = 2.0;  // full width of the envelope moving average
	double breathsMin = 6.0;
	double breathsMax = 30.0;

	// Quality (skewness heuristic)
	double skewOnsetPct = 13.0;      // quality starts to decay above this
	double skewZeroPct = 50.0;       // quality reaches 0 here
	double flatStdThreshold = 0.01;  // near-flat signal (finger not covering sensor)
	double flatPenalty = 0.5;

	// Fusion
	double fingerprintWeight = 0.6;
	double ppgWeight = 0.4;
	double heartRateTolerance = 10.0; // bpm
	double authThreshold = 0.7;       // fused score must exceed this

	// Remote reconciliation
	double remoteConfidenceMin = 0.7; // below -> isEstimate
	int remoteTimeoutMs = 10000;
	int remoteMaxPending = 2;         // outstanding calls per analyzer, timed-out ones included

	// Measurement session
	double sessionSeconds = 60.0;
	double sessionMinFraction = 0.5;
	double fingerWindowSec = 10.0;
	int fingerMinSamples = 10;
	double fingerMinStdDev = 5.0;     // raw 0..255 intensity scale
	double fingerMinRange = 15.0;
};

struct PPGResult {
	bool success = false;
	std::optional<double> heartRate;            // bpm
	std::optional<double> heartRateVariability; // RMSSD, ms
	std::optional<double> respiratoryRate;      // breaths/min
	double signalQuality = 0.0;                 // 0..1
	bool isEstimate = false;                    // low-confidence number (remote only)
	std::optional<double> confidence;           // 0..1 ML confidence when available
	std::string error;                          // empty on success
};

// Main API: run the full local pipeline on raw intensity samples captured at sampleRate (Hz).
// Throws std::invalid_argument if sampleRate is not a finite positive number.
// A successful result with signalQuality 0 (flat input) carries a fallback heart rate, not a reading.
PPGResult processPPG(const std::vector<double>& signal, double sampleRate = 14.0, const Options& opt = {});

// Pipeline stages
std::vector<double> normalizeSignal(const std::vector<double>& signal);
std::vector<double> filterSignal(const std::vector<double>& signal, double sampleRate, const Options& opt = {});
std::vector<double> movingAverage(const std::vector<double>& signal, int halfWidth);

// Strict local maxima (greater than both neighbours)
std::vector<int> detectPeaks(const std::vector<double>& signal);

// Estimators
double estimateHeartRate(const std::vector<double>& filtered, double sampleRate, const Options& opt = {});
double estimateHeartRateAutocorr(const std::vector<double>& filtered, double sampleRate, const Options& opt = {});
std::optional<double> estimateHRV(const std::vector<double>& filtered, double sampleRate, const Options& opt = {});
std::optional<double> estimateRespiratoryRate(const std::vector<double>& filtered, double sampleRate, const Options& opt = {});

// Quality assessment
double scoreQuality(const std::vector<double>& filtered, const Options& opt = {});

// Inclusive [bpmMin, bpmMax] check applied by processPPG
bool checkHeartRateBounds(double bpm, const Options& opt = {});

}

#include "pulsefuse_remote.h"
#include "pulsefuse_log.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>
#include <thread>

namespace pulsefuse {

namespace {

std::string isoTimestampUtc() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

std::string joinWarnings(const std::vector<std::string>& warnings) {
    std::ostringstream os;
    for (size_t i = 0; i < warnings.size(); ++i) {
        if (i) os << ", ";
        os << warnings[i];
    }
    return os.str();
}

bool looksLikeAuthError(const std::string& msg) {
    return msg.find("unauthenticated") != std::string::npos ||
           msg.find("not authenticated") != std::string::npos ||
           msg.find("User must be authenticated") != std::string::npos;
}

// Counts a remote call as pending for the lifetime of the worker running it
struct PendingGuard {
    explicit PendingGuard(std::shared_ptr<std::atomic<int>> c) : count(std::move(c)) {}
    ~PendingGuard() { --*count; }
    std::shared_ptr<std::atomic<int>> count;
};

bool usable(const std::optional<double>& v) {
    return v.has_value() && std::isfinite(*v);
}

} // namespace

const char* remoteErrorKindName(RemoteErrorKind kind) {
    switch (kind) {
        case RemoteErrorKind::Unauthenticated: return "unauthenticated";
        case RemoteErrorKind::Timeout: return "timeout";
        case RemoteErrorKind::Service: break;
    }
    return "service";
}

RemoteRequest makeRemoteRequest(const std::vector<double>& signal, double sampleRate, const std::string& userId) {
    RemoteRequest req;
    req.signal = signal;
    req.sampleRate = sampleRate;
    req.durationSeconds = sampleRate > 0.0 ? static_cast<double>(signal.size()) / sampleRate : 0.0;
    req.userId = userId;
    req.metadata["source"] = "pulsefuse";
    req.metadata["platform"] = "native";
    req.metadata["timestamp"] = isoTimestampUtc();
    return req;
}

RemoteOutcome invokeWithTimeout(std::function<RemoteOutcome()> call, std::chrono::milliseconds timeout) {
    if (!call) return RemoteError{RemoteErrorKind::Service, "no remote call"};
    // The worker owns the task; a hung call keeps only its own state alive.
    auto task = std::make_shared<std::packaged_task<RemoteOutcome()>>(std::move(call));
    std::future<RemoteOutcome> fut = task->get_future();
    std::thread([task]() { (*task)(); }).detach();
    if (fut.wait_for(timeout) != std::future_status::ready) {
        return RemoteError{RemoteErrorKind::Timeout, "remote analysis timed out"};
    }
    try {
        return fut.get();
    } catch (const AuthenticationError& e) {
        return RemoteError{RemoteErrorKind::Unauthenticated, e.what()};
    } catch (const std::exception& e) {
        std::string msg = e.what();
        return RemoteError{looksLikeAuthError(msg) ? RemoteErrorKind::Unauthenticated : RemoteErrorKind::Service, msg};
    } catch (...) {
        // non-std exception types
        return RemoteError{RemoteErrorKind::Service, "unknown remote error"};
    }
}

PPGResult reconcile(const PPGResult& local, const RemoteOutcome& remote, const Options& opt) {
    auto lg = logger();
    if (const RemoteError* err = std::get_if<RemoteError>(&remote)) {
        if (err->kind == RemoteErrorKind::Unauthenticated) {
            lg->debug("reconcile: remote skipped ({}), using local result", err->message);
        } else {
            lg->warn("reconcile: remote analysis unavailable [{}]: {}; using local result",
                     remoteErrorKindName(err->kind), err->message);
        }
        return local;
    }

    const RemoteResponse& resp = std::get<RemoteResponse>(remote);
    if (!usable(resp.heartRate)) {
        lg->debug("reconcile: remote returned no usable heart rate, using local result");
        return local;
    }

    PPGResult out;
    out.heartRate = resp.heartRate;
    if (usable(resp.heartRateVariability)) out.heartRateVariability = resp.heartRateVariability;
    if (usable(resp.respiratoryRate)) out.respiratoryRate = resp.respiratoryRate;
    out.signalQuality = std::isfinite(resp.signalQuality) ? std::max(0.0, std::min(1.0, resp.signalQuality)) : 0.0;
    out.confidence = resp.confidence;

    if (resp.success) {
        out.success = true;
        out.isEstimate = resp.confidence.value_or(0.0) < opt.remoteConfidenceMin;
        out.error = joinWarnings(resp.warnings);
        lg->info("reconcile: remote estimate {} bpm preferred (estimate={})", *out.heartRate, out.isEstimate);
        return out;
    }

    // A low-confidence number beats no number, but stays flagged as failed.
    out.success = false;
    out.isEstimate = true;
    if (!resp.warnings.empty()) out.error = joinWarnings(resp.warnings);
    else if (resp.error && !resp.error->empty()) out.error = *resp.error;
    else out.error = "remote analysis failed";
    lg->info("reconcile: remote analysis failed but supplied {} bpm, kept as estimate", *out.heartRate);
    return out;
}

PPGResult reconcile(const PPGResult& local,
                    std::function<RemoteOutcome()> remoteCall,
                    std::chrono::milliseconds timeout,
                    const Options& opt) {
    return reconcile(local, invokeWithTimeout(std::move(remoteCall), timeout), opt);
}

PPGResult LocalAnalyzer::analyze(const std::vector<double>& signal, double sampleRate) {
    return processPPG(signal, sampleRate, opt_);
}

ReconcilingAnalyzer::ReconcilingAnalyzer(std::shared_ptr<RemoteAnalysisService> service, AuthContext auth, const Options& opt)
    : service_(std::move(service)), auth_(std::move(auth)), opt_(opt),
      pending_(std::make_shared<std::atomic<int>>(0)) {}

PPGResult ReconcilingAnalyzer::analyze(const std::vector<double>& signal, double sampleRate) {
    PPGResult local = processPPG(signal, sampleRate, opt_);
    if (!auth_.authenticated || !service_) {
        logger()->debug("ReconcilingAnalyzer: not authenticated, local result only");
        return local;
    }
    const int inFlight = pending_->load();
    if (inFlight >= std::max(1, opt_.remoteMaxPending)) {
        logger()->warn("ReconcilingAnalyzer: {} remote calls still pending, using local result", inFlight);
        return local;
    }
    auto service = service_;
    auto request = std::make_shared<RemoteRequest>(makeRemoteRequest(signal, sampleRate, auth_.userId));
    ++*pending_;
    auto guard = std::make_shared<PendingGuard>(pending_);
    auto call = [service, request, guard]() { return service->analyze(*request); };
    return reconcile(local, call, std::chrono::milliseconds(std::max(1, opt_.remoteTimeoutMs)), opt_);
}

} // namespace pulsefuse

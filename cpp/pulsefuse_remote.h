// Remote ML estimate reconciliation and the local/remote analyzer strategies
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "pulsefuse_core.h"

namespace pulsefuse {

struct RemoteRequest {
    std::vector<double> signal;
    double sampleRate = 0.0;
    double durationSeconds = 0.0;
    std::string userId;
    std::map<std::string, std::string> metadata;
};

struct RemoteResponse {
    bool success = false;
    std::optional<double> heartRate;
    std::optional<double> heartRateVariability;
    std::optional<double> respiratoryRate;
    double signalQuality = 0.0;
    std::optional<double> confidence;
    std::vector<std::string> warnings;
    std::optional<std::string> error;
};

enum class RemoteErrorKind { Unauthenticated, Service, Timeout };

struct RemoteError {
    RemoteErrorKind kind = RemoteErrorKind::Service;
    std::string message;
};

using RemoteOutcome = std::variant<RemoteResponse, RemoteError>;

// Thrown by service implementations when the caller's credentials are rejected.
class AuthenticationError : public std::runtime_error {
public:
    explicit AuthenticationError(const std::string& what) : std::runtime_error(what) {}
};

// The remote analysis collaborator. analyze() may throw. Implementations must apply their
// own transport timeout: a call that never returns keeps its worker thread alive.
class RemoteAnalysisService {
public:
    virtual ~RemoteAnalysisService() = default;
    virtual RemoteOutcome analyze(const RemoteRequest& request) = 0;
};

struct AuthContext {
    bool authenticated = false;
    std::string userId;
};

RemoteRequest makeRemoteRequest(const std::vector<double>& signal, double sampleRate, const std::string& userId);

// Runs call on a detached worker and waits at most timeout. Exceptions of any type and
// timeouts come back as RemoteError; a late result is discarded. A timed-out worker is not
// cancelled and exits only when call returns.
RemoteOutcome invokeWithTimeout(std::function<RemoteOutcome()> call, std::chrono::milliseconds timeout);

// Merge a remote outcome over the local result.
PPGResult reconcile(const PPGResult& local, const RemoteOutcome& remote, const Options& opt = {});
PPGResult reconcile(const PPGResult& local,
                    std::function<RemoteOutcome()> remoteCall,
                    std::chrono::milliseconds timeout,
                    const Options& opt = {});

const char* remoteErrorKindName(RemoteErrorKind kind);

class PPGAnalyzer {
public:
    virtual ~PPGAnalyzer() = default;
    virtual PPGResult analyze(const std::vector<double>& signal, double sampleRate) = 0;
};

// processPPG only
class LocalAnalyzer : public PPGAnalyzer {
public:
    explicit LocalAnalyzer(const Options& opt = {}) : opt_(opt) {}
    PPGResult analyze(const std::vector<double>& signal, double sampleRate) override;

private:
    Options opt_;
};

// processPPG, then the remote overlay when the caller is authenticated. At most
// opt.remoteMaxPending calls (timed-out ones included) may be outstanding; beyond that the
// local result is returned without calling the service.
class ReconcilingAnalyzer : public PPGAnalyzer {
public:
    ReconcilingAnalyzer(std::shared_ptr<RemoteAnalysisService> service, AuthContext auth, const Options& opt = {});
    PPGResult analyze(const std::vector<double>& signal, double sampleRate) override;

    void setAuthContext(const AuthContext& auth) { auth_ = auth; }
    int pendingCalls() const { return pending_->load(); }

private:
    std::shared_ptr<RemoteAnalysisService> service_;
    AuthContext auth_;
    Options opt_;
    std::shared_ptr<std::atomic<int>> pending_;
};

} // namespace pulsefuse

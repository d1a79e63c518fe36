#pragma once

#include <cargo3ds/cli/Options.hpp>
#include <cargo3ds/deploy/Cancel.hpp>
#include <cargo3ds/deploy/Transport.hpp>
#include <cargo3ds/diag/Error.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace cargo3ds::deploy {

enum class State : uint8_t {
    kIdle,
    kResolving,
    kConnecting,
    kTransferring,
    kRunning,
    kListening,
    kFailed,
};

const char* state_name(State s);

struct DeployPolicy {
    uint32_t retries = cli::k_default_retries;
    std::chrono::milliseconds retry_delay{1000};
    std::chrono::milliseconds discovery_timeout{10000};
};

/// Drives one transfer through Resolving, Connecting and Transferring.
/// Only connection attempts are retried.
class Deployer {
public:
    Deployer(Transport& transport, CancelToken cancel, DeployPolicy policy);

    bool deploy(const TransferRequest& req, const cli::DeployOptions& opts, diag::Error& err);

    State state() const { return state_; }
    const std::vector<State>& history() const { return history_; }
    uint64_t attempts() const { return attempts_; }
    const std::string& address() const { return address_; }

private:
    void enter(State s);
    bool fail(diag::Error& err, diag::Error e);

    Transport& transport_;
    CancelToken cancel_;
    DeployPolicy policy_;

    State state_ = State::kIdle;
    std::vector<State> history_{State::kIdle};
    uint64_t attempts_ = 0;
    std::string address_{};
};

} // namespace cargo3ds::deploy

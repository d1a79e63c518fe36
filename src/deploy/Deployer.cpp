#include <cargo3ds/deploy/Deployer.hpp>

#include <cargo3ds/ui/Log.hpp>

#include <utility>

namespace cargo3ds::deploy {

const char* state_name(State s) {
    switch (s) {
        case State::kIdle: return "idle";
        case State::kResolving: return "resolving";
        case State::kConnecting: return "connecting";
        case State::kTransferring: return "transferring";
        case State::kRunning: return "running";
        case State::kListening: return "listening";
        case State::kFailed: return "failed";
    }
    return "idle";
}

Deployer::Deployer(Transport& transport, CancelToken cancel, DeployPolicy policy)
    : transport_(transport), cancel_(std::move(cancel)), policy_(policy) {}

void Deployer::enter(State s) {
    state_ = s;
    history_.push_back(s);
}

bool Deployer::fail(diag::Error& err, diag::Error e) {
    enter(State::kFailed);
    err = std::move(e);
    return false;
}

bool Deployer::deploy(const TransferRequest& req, const cli::DeployOptions& opts, diag::Error& err) {
    using diag::Code;

    enter(State::kResolving);
    if (opts.address.has_value()) {
        address_ = *opts.address;
    } else {
        ui::progress(70, "discovering a 3DS on the local network");
        const auto found = transport_.discover(policy_.discovery_timeout, cancel_);
        if (cancel_.cancelled()) {
            return fail(err, diag::make_error(Code::D_CANCELLED, "Deploy failed: interrupted during discovery"));
        }
        if (!found.has_value()) {
            return fail(err, diag::make_error(Code::D_DEVICE_NOT_FOUND,
                                              "Deploy failed: no device answered within " +
                                                  std::to_string(policy_.discovery_timeout.count()) + "ms",
                                              "start the homebrew launcher and press Y, or pass --address"));
        }
        address_ = *found;
    }

    enter(State::kConnecting);
    const uint64_t total = static_cast<uint64_t>(policy_.retries) + 1;
    std::string last_err{};
    bool connected = false;
    while (attempts_ < total) {
        if (cancel_.cancelled()) {
            return fail(err, diag::make_error(Code::D_CANCELLED, "Deploy failed: interrupted while connecting"));
        }
        ++attempts_;
        last_err.clear();
        if (transport_.connect(address_, last_err)) {
            connected = true;
            break;
        }
        if (attempts_ >= total) break;

        ui::warn("connection attempt " + std::to_string(attempts_) + "/" + std::to_string(total) +
                 " to " + address_ + " failed: " + last_err);
        if (!cancel_.sleep_for(policy_.retry_delay)) {
            return fail(err, diag::make_error(Code::D_CANCELLED, "Deploy failed: interrupted while connecting"));
        }
    }
    if (!connected) {
        return fail(err, diag::make_error(Code::D_CONNECTION_EXHAUSTED,
                                          "Deploy failed: could not connect to " + address_ + " after " +
                                              std::to_string(attempts_) + " attempt(s)",
                                          last_err));
    }

    if (opts.server) {
        std::string listen_err{};
        if (!transport_.listen(listen_err)) {
            return fail(err, diag::make_error(Code::D_SERVER_FAILED,
                                              "Deploy failed: could not open the stdio listener", listen_err));
        }
    }

    enter(State::kTransferring);
    ui::progress(85, "sending " + req.file.filename().string() + " to " + address_);
    std::string transfer_err{};
    const int rc = transport_.transfer(address_, req, transfer_err);
    if (rc != 0) {
        return fail(err, diag::make_child_error(Code::D_TRANSFER_ABORTED, rc,
                                                "Deploy failed: transfer to " + address_ + " aborted",
                                                transfer_err));
    }

    if (!opts.server) {
        enter(State::kRunning);
        return true;
    }

    enter(State::kListening);
    ui::note("listening for the console's output, press Ctrl-C to stop");
    std::string serve_err{};
    if (!transport_.serve(cancel_, serve_err)) {
        return fail(err, diag::make_error(Code::D_SERVER_FAILED, "Deploy failed: stdio listener stopped", serve_err));
    }
    return true;
}

} // namespace cargo3ds::deploy

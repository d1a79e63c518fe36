#pragma once

#include <cargo3ds/deploy/Cancel.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cargo3ds::deploy {

struct TransferRequest {
    std::filesystem::path file{};
    std::optional<std::string> argv0{};
    std::vector<std::string> exec_args{};
};

/// Device-link seam. The deployer owns the state machine, a transport only moves bytes.
class Transport {
public:
    virtual ~Transport() = default;

    /// Address of the first device answering within `timeout`; nullopt on timeout or cancel.
    virtual std::optional<std::string> discover(std::chrono::milliseconds timeout, const CancelToken& cancel) = 0;

    /// One connection attempt.
    virtual bool connect(const std::string& address, std::string& err) = 0;

    /// Opens the stdio listener ahead of the transfer so the first session is not missed.
    virtual bool listen(std::string& err) = 0;

    /// 0 on success, otherwise the failing status of the link.
    virtual int transfer(const std::string& address, const TransferRequest& req, std::string& err) = 0;

    /// Blocks on the listener until `cancel` fires.
    virtual bool serve(const CancelToken& cancel, std::string& err) = 0;
};

} // namespace cargo3ds::deploy

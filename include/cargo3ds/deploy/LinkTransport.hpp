#pragma once

#include <cargo3ds/deploy/Transport.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace cargo3ds::deploy {

inline constexpr uint16_t k_link_port = 17491;

struct LinkSettings {
    std::string link_tool{"3dslink"};
    std::chrono::milliseconds connect_timeout{3000};
};

/// 3dslink on the host, the netloader on the console.
class LinkTransport final : public Transport {
public:
    explicit LinkTransport(LinkSettings settings);
    ~LinkTransport() override;

    LinkTransport(const LinkTransport&) = delete;
    LinkTransport& operator=(const LinkTransport&) = delete;

    std::optional<std::string> discover(std::chrono::milliseconds timeout, const CancelToken& cancel) override;
    bool connect(const std::string& address, std::string& err) override;
    bool listen(std::string& err) override;
    int transfer(const std::string& address, const TransferRequest& req, std::string& err) override;
    bool serve(const CancelToken& cancel, std::string& err) override;

    std::vector<std::string> link_argv(const std::string& address, const TransferRequest& req) const;

private:
    LinkSettings settings_;
    int listen_fd_ = -1;
};

} // namespace cargo3ds::deploy

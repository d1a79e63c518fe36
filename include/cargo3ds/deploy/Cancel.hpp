#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace cargo3ds::deploy {

/// Cooperative cancellation flag shared between the deployer and its transport.
class CancelToken {
public:
    CancelToken();
    explicit CancelToken(std::atomic<bool>* external);

    bool cancelled() const;
    void cancel();

    /// Sleeps in short slices; false when cancelled before `d` elapsed.
    bool sleep_for(std::chrono::milliseconds d) const;

private:
    std::shared_ptr<std::atomic<bool>> owned_;
    std::atomic<bool>* flag_ = nullptr;
};

/// Installs SIGINT/SIGTERM handlers that fire the returned token.
CancelToken install_interrupt_handler();

} // namespace cargo3ds::deploy

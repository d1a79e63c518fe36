#include <cargo3ds/deploy/Cancel.hpp>

#include <algorithm>
#include <csignal>
#include <thread>

namespace cargo3ds::deploy {

namespace {

constexpr std::chrono::milliseconds k_poll_slice{50};

std::atomic<bool> g_interrupted{false};

void on_interrupt(int /*signal*/) {
    g_interrupted.store(true);
}

} // namespace

CancelToken::CancelToken()
    : owned_(std::make_shared<std::atomic<bool>>(false)), flag_(owned_.get()) {}

CancelToken::CancelToken(std::atomic<bool>* external)
    : flag_(external) {}

bool CancelToken::cancelled() const {
    return flag_->load();
}

void CancelToken::cancel() {
    flag_->store(true);
}

bool CancelToken::sleep_for(std::chrono::milliseconds d) const {
    const auto deadline = std::chrono::steady_clock::now() + d;
    while (!cancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, k_poll_slice));
    }
    return false;
}

CancelToken install_interrupt_handler() {
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
    return CancelToken(&g_interrupted);
}

} // namespace cargo3ds::deploy

#include "../include/cancellation.hpp"
#include <csignal>
#include <stdexcept>
#include <utility>

namespace {
std::atomic<CancellationToken*> g_sigint_target{nullptr};

void on_sigint(int) {
    if (auto* t = g_sigint_target.load()) t->cancel();
}
}

ScopedSigintCancel::ScopedSigintCancel(std::shared_ptr<CancellationToken> token)
    : token_(std::move(token)), previous_(SIG_DFL) {
    if (!token_) throw std::invalid_argument("SIGINT scope needs a cancellation token");
    g_sigint_target.store(token_.get());
    previous_ = std::signal(SIGINT, on_sigint);
    if (previous_ == SIG_ERR) previous_ = SIG_DFL;
}

ScopedSigintCancel::~ScopedSigintCancel() {
    std::signal(SIGINT, previous_);
    g_sigint_target.store(nullptr);
}

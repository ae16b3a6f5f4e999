#include "core/cancel_token.h"

bool CancelToken::isCancelled() const
{
    return state_ && state_->cancelled;
}

void CancelToken::onCancel(std::function<void()> hook) const
{
    if (!state_ || !hook) return;
    if (state_->cancelled) {
        hook();
        return;
    }
    state_->hooks.push_back(std::move(hook));
}

CancelSource::CancelSource()
    : state_(std::make_shared<CancelToken::State>())
{
}

CancelSource::~CancelSource()
{
    cancel();
}

CancelToken CancelSource::token() const
{
    return CancelToken(state_);
}

bool CancelSource::isCancelled() const
{
    return state_->cancelled;
}

void CancelSource::cancel()
{
    if (state_->cancelled) return;
    state_->cancelled = true;
    // hooks may register further hooks or drop the last reference; run a copy
    std::vector<std::function<void()>> hooks;
    hooks.swap(state_->hooks);
    for (auto& h : hooks) {
        if (h) h();
    }
}

void CancelSource::reset()
{
    cancel();
    state_ = std::make_shared<CancelToken::State>();
}

#pragma once
#include <functional>
#include <memory>
#include <vector>

// Cancellation for asynchronous requests. A CancelSource belongs to one
// activation of a screen controller; every request issued during that
// activation carries a CancelToken copied from it. Once the source is
// cancelled the token reports it and registered abort hooks run once.
class CancelToken {
public:
    CancelToken() = default;  // a token that can never be cancelled

    bool isCancelled() const;

    // Runs immediately if already cancelled.
    void onCancel(std::function<void()> hook) const;

private:
    friend class CancelSource;
    struct State {
        bool cancelled = false;
        std::vector<std::function<void()>> hooks;
    };
    explicit CancelToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancelSource {
public:
    CancelSource();
    ~CancelSource();

    CancelSource(const CancelSource&) = delete;
    CancelSource& operator=(const CancelSource&) = delete;

    CancelToken token() const;
    bool isCancelled() const;

    void cancel();
    // Cancel everything issued so far and start a fresh generation.
    void reset();

private:
    std::shared_ptr<CancelToken::State> state_;
};

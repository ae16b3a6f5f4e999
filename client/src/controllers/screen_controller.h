#pragma once
#include <QObject>
#include <QString>

#include "core/cancel_token.h"
#include "net/api_error.h"

class ApiClient;

// Base of every screen. One activation == one CancelSource generation:
// deactivate() cancels everything the screen still has in flight, so late
// replies never reach a screen that is no longer shown.
class ScreenController : public QObject {
    Q_OBJECT
public:
    enum class State {
        Idle,
        Loading,
        Loaded,
        Error
    };
    Q_ENUM(State)

    explicit ScreenController(ApiClient* api, QObject* parent = nullptr);
    ~ScreenController() override = default;

    State state() const { return m_state; }
    bool isActive() const { return m_active; }
    QString errorMessage() const { return m_error.message; }
    const ApiError& lastError() const { return m_error; }

    void activate();
    void deactivate();
    // Error/Loaded -> Loading, re-runs whatever the screen loads on activation
    void retry();

    static QString stateName(State s);

signals:
    void stateChanged(ScreenController::State state);
    void errorOccurred(const QString& message);

protected:
    // what to fetch when shown; screens with nothing to fetch stay Idle
    virtual void onActivated() {}
    virtual void onDeactivated() {}
    virtual void reload() {}

    void setState(State s);
    void fail(const ApiError& err);
    CancelToken token() const { return m_cancel.token(); }
    ApiClient* api() const { return m_api; }

private:
    ApiClient* m_api = nullptr;
    CancelSource m_cancel;
    State m_state = State::Idle;
    ApiError m_error;
    bool m_active = false;
};

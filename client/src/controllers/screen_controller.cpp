#include "controllers/screen_controller.h"

#include "log/logger.h"

ScreenController::ScreenController(ApiClient* api, QObject* parent)
    : QObject(parent),
      m_api(api)
{
}

void ScreenController::activate()
{
    m_cancel.reset();
    m_active = true;
    setState(State::Idle);
    gme::Logger::debug(metaObject()->className() + std::string(" activated"), "nav");
    onActivated();
}

void ScreenController::deactivate()
{
    if (!m_active) return;
    m_active = false;
    m_cancel.reset();
    gme::Logger::debug(metaObject()->className() + std::string(" deactivated in state ") +
                       stateName(m_state).toStdString(), "nav");
    onDeactivated();
}

void ScreenController::retry()
{
    if (!m_active || m_state == State::Loading) return;
    m_cancel.reset();
    m_error = ApiError{};
    reload();
}

void ScreenController::setState(State s)
{
    if (s != State::Error) m_error = ApiError{};
    if (m_state == s) return;
    m_state = s;
    emit stateChanged(m_state);
}

void ScreenController::fail(const ApiError& err)
{
    m_error = err;
    gme::Logger::warn(std::string(metaObject()->className()) + ": " + err.toString().toStdString(), "ui");
    if (m_state != State::Error) {
        m_state = State::Error;
        emit stateChanged(m_state);
    }
    emit errorOccurred(err.message);
}

QString ScreenController::stateName(State s)
{
    switch (s) {
    case State::Idle:    return "Idle";
    case State::Loading: return "Loading";
    case State::Loaded:  return "Loaded";
    case State::Error:   return "Error";
    }
    return "Idle";
}

#include "client_app.h"

#include <QApplication>
#include <QtGlobal>
#include <cstdlib>
#include <memory>

#include "controllers/navigator.h"
#include "core/app_context.h"
#include "log/log_manager.h"
#include "log/log_sink_console.h"
#include "log/log_sink_file.h"
#include "log/logger.h"
#include "ui/main_window.h"

namespace gme {

namespace {

void forwardQtMessage(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    LogLevel level = LogLevel::Info;
    switch (type) {
    case QtDebugMsg:    level = LogLevel::Debug; break;
    case QtInfoMsg:     level = LogLevel::Info; break;
    case QtWarningMsg:  level = LogLevel::Warn; break;
    case QtCriticalMsg:
    case QtFatalMsg:    level = LogLevel::Error; break;
    }
    Logger::Fields fields;
    if (ctx.category && std::string(ctx.category) != "default") fields["category"] = ctx.category;
    Logger::write(level, "qt", msg.toStdString(), fields);
    if (type == QtFatalMsg) std::abort();
}

} // namespace

ClientApp::ClientApp() = default;

ClientApp::~ClientApp()
{
    qInstallMessageHandler(nullptr);
    // window first: its pages point into the navigator's controllers
    m_window.reset();
    m_nav.reset();
    m_ctx.reset();
}

int ClientApp::run()
{
    // 1. configuration: JSON file (GME_CONFIG_FILE) then GME_* environment
    init_config();

    // 2. logging; warnings raised while reading the configuration are
    // replayed to the sinks added here
    init_logger();
    Logger::info("===== GME Client Starting =====");

    // 3. session, API client, screens
    init_ui();
    m_nav->start();

    const int rc = QApplication::exec();
    Logger::info("GME Client exiting with code " + std::to_string(rc));
    return rc;
}

void ClientApp::init_config()
{
    m_config = Config::fromEnvironment();
}

void ClientApp::init_logger()
{
    auto& lm = LogManager::instance();
    lm.setMinLevel(m_config.log_level());
    lm.addSink(std::make_shared<ConsoleLogSink>());

    const std::string logPath = m_config.log_path().toStdString();
    if (!logPath.empty()) {
        FileLogSink::Options opt;
        opt.path = logPath;
        lm.addSink(std::make_shared<FileLogSink>(opt));
    }
    qInstallMessageHandler(forwardQtMessage);
    lm.releaseEarlyRecords();

    Logger::info(std::string("Logger initialized") +
                 (logPath.empty() ? " (console-only)" : (" (file=" + logPath + ")")));
    Logger::write(LogLevel::Info, "app", "configuration",
                  {{"management_url", m_config.management_url().toStdString()},
                   {"video_url", m_config.video_service_url().toStdString()},
                   {"audio_url", m_config.audio_service_url().toStdString()},
                   {"timeout_s", std::to_string(m_config.timeout_seconds())},
                   {"retries", std::to_string(m_config.max_retries())}});
}

void ClientApp::init_ui()
{
    m_ctx = std::make_unique<AppContext>(m_config);
    m_nav = std::make_unique<Navigator>(m_ctx.get());
    m_window = std::make_unique<MainWindow>(m_ctx.get(), m_nav.get());
    m_window->show();
}

} // namespace gme

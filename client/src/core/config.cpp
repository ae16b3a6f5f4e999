#include "core/config.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>          // getenv
#include <fstream>
#include <nlohmann/json.hpp>
#include <QDir>
#include <QStandardPaths>
#include <QUrl>

namespace gme {

namespace {

QString envString(const char* name, bool* present = nullptr) {
    const char* p = std::getenv(name);
    if (present) *present = (p != nullptr);
    return p ? QString::fromLocal8Bit(p) : QString();
}

} // namespace

Config::Config()
    : m_managementUrl(kDefaultManagementUrl),
      m_videoServiceUrl(kDefaultVideoServiceUrl),
      m_audioServiceUrl(kDefaultAudioServiceUrl),
      m_cookieName(kDefaultCookieName),
      m_appDataDir(defaultAppDataDir())
{
    m_logPath = QDir(m_appDataDir).filePath("logs/gme-client.log");
}

Config Config::fromEnvironment() {
    Config cfg;
    if (const char* p = std::getenv("GME_CONFIG_FILE")) {
        cfg.load(p);
    }
    cfg.load_from_env();
    return cfg;
}

int Config::timeout_ms() const {
    // m_timeoutSeconds is kept inside [kMinTimeoutSeconds, kMaxTimeoutSeconds]
    return std::max(1, static_cast<int>(std::lround(m_timeoutSeconds * 1000.0)));
}

QString Config::session_file_path() const {
    return QDir(m_appDataDir).filePath("session.ini");
}

void Config::set_management_url(const QString& url) {
    m_managementUrl = normalizeManagementUrl(url);
}

void Config::set_video_service_url(const QString& url) {
    m_videoServiceUrl = normalizeServiceUrl(url, kDefaultVideoServiceUrl);
}

void Config::set_audio_service_url(const QString& url) {
    m_audioServiceUrl = normalizeServiceUrl(url, kDefaultAudioServiceUrl);
}

void Config::set_timeout_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        Logger::warn("ignoring invalid request timeout: " + std::to_string(seconds), "config");
        return;
    }
    if (seconds < kMinTimeoutSeconds || seconds > kMaxTimeoutSeconds) {
        const double clamped = std::clamp(seconds, kMinTimeoutSeconds, kMaxTimeoutSeconds);
        Logger::warn("request timeout " + std::to_string(seconds) + " s out of range, using " +
                     std::to_string(clamped) + " s", "config");
        seconds = clamped;
    }
    m_timeoutSeconds = seconds;
}

void Config::set_session_cookie_name(const QString& name) {
    const QString v = name.trimmed();
    m_cookieName = v.isEmpty() ? QString(kDefaultCookieName) : v;
}

void Config::set_max_retries(int retries) {
    m_maxRetries = std::clamp(retries, 0, kMaxRetries);
}

void Config::set_retry_backoff_ms(int ms) {
    m_retryBackoffMs = std::clamp(ms, 0, kMaxRetryBackoffMs);
}

void Config::set_app_data_dir(const QString& dir) {
    if (dir.trimmed().isEmpty()) return;
    m_appDataDir = dir.trimmed();
    if (!m_logPathExplicit) {
        m_logPath = QDir(m_appDataDir).filePath("logs/gme-client.log");
    }
}

QString Config::normalizeManagementUrl(const QString& raw) {
    QString value = raw.trimmed();
    while (value.endsWith('/')) value.chop(1);
    if (value.isEmpty()) {
        return kDefaultManagementUrl;
    }
    if (!value.contains("://")) {
        value = "http://" + value;
    }
    const QUrl url(value);
    const QString path = url.path();
    if (path.isEmpty() || path == "/") {
        return value + "/api/v1";
    }
    return value;
}

QString Config::normalizeServiceUrl(const QString& raw, const QString& fallback) {
    QString value = raw.trimmed();
    while (value.endsWith('/')) value.chop(1);
    if (value.isEmpty()) return fallback;
    if (!value.contains("://")) value = "http://" + value;
    return value;
}

QString Config::defaultAppDataDir() {
    const QString location = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (!location.isEmpty()) return location;
    return QDir::current().filePath(".gme-app-data");
}

bool Config::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        Logger::warn("Config file not found: " + path + ", using defaults", "config");
        return false;
    }

    try {
        nlohmann::json j;
        ifs >> j;

        if (j.contains("services") && j["services"].is_object()) {
            const auto& s = j["services"];
            if (s.contains("management_url") && s["management_url"].is_string()) {
                set_management_url(QString::fromStdString(s["management_url"].get<std::string>()));
            }
            if (s.contains("video_url") && s["video_url"].is_string()) {
                set_video_service_url(QString::fromStdString(s["video_url"].get<std::string>()));
            }
            if (s.contains("audio_url") && s["audio_url"].is_string()) {
                set_audio_service_url(QString::fromStdString(s["audio_url"].get<std::string>()));
            }
            if (s.contains("audio_api_key") && s["audio_api_key"].is_string()) {
                m_audioApiKey = QString::fromStdString(s["audio_api_key"].get<std::string>());
            }
        }

        if (j.contains("http") && j["http"].is_object()) {
            const auto& h = j["http"];
            if (h.contains("timeout_seconds") && h["timeout_seconds"].is_number()) {
                set_timeout_seconds(h["timeout_seconds"].get<double>());
            }
            if (h.contains("retries") && h["retries"].is_number_integer()) {
                set_max_retries(h["retries"].get<int>());
            }
            if (h.contains("retry_backoff_ms") && h["retry_backoff_ms"].is_number_integer()) {
                set_retry_backoff_ms(h["retry_backoff_ms"].get<int>());
            }
        }

        if (j.contains("session") && j["session"].is_object()) {
            const auto& s = j["session"];
            if (s.contains("cookie_name") && s["cookie_name"].is_string()) {
                set_session_cookie_name(QString::fromStdString(s["cookie_name"].get<std::string>()));
            }
        }

        if (j.contains("log") && j["log"].is_object()) {
            const auto& l = j["log"];
            if (l.contains("path") && l["path"].is_string()) {
                set_log_path(QString::fromStdString(l["path"].get<std::string>()));
            }
            if (l.contains("level") && l["level"].is_string()) {
                LogLevel lv;
                if (Logger::parse_level(l["level"].get<std::string>(), lv)) {
                    m_logLevel = lv;
                } else {
                    Logger::warn("unknown log level in " + path, "config");
                }
            }
        }

        Logger::info("Config loaded from: " + path, "config");
        return true;
    }
    catch (const std::exception& ex) {
        Logger::error(std::string("Failed to parse config file: ") + path +
                      ", error: " + ex.what(), "config");
        return false;
    }
}

void Config::load_from_env() {
    bool present = false;

    QString v = envString("GME_MANAGEMENT_URL", &present);
    if (present) set_management_url(v);

    v = envString("GME_VIDEO_SERVICE_URL", &present);
    if (present) set_video_service_url(v);

    v = envString("GME_AUDIO_SERVICE_URL", &present);
    if (present) set_audio_service_url(v);

    v = envString("GME_AUDIO_SERVICE_API_KEY", &present);
    if (present) m_audioApiKey = v.trimmed();

    v = envString("GME_REQUEST_TIMEOUT", &present);
    if (present) {
        bool ok = false;
        const double seconds = v.trimmed().toDouble(&ok);
        if (ok) set_timeout_seconds(seconds);
        else Logger::warn("GME_REQUEST_TIMEOUT is not a number: " + v.toStdString(), "config");
    }

    v = envString("GME_SESSION_COOKIE_NAME", &present);
    if (present) set_session_cookie_name(v);

    v = envString("GME_REQUEST_RETRIES", &present);
    if (present) {
        bool ok = false;
        const int n = v.trimmed().toInt(&ok);
        if (ok) set_max_retries(n);
        else Logger::warn("GME_REQUEST_RETRIES is not an integer: " + v.toStdString(), "config");
    }

    v = envString("GME_REQUEST_RETRY_BACKOFF_MS", &present);
    if (present) {
        bool ok = false;
        const int n = v.trimmed().toInt(&ok);
        if (ok) set_retry_backoff_ms(n);
        else Logger::warn("GME_REQUEST_RETRY_BACKOFF_MS is not an integer: " + v.toStdString(), "config");
    }

    v = envString("GME_APP_DATA_DIR", &present);
    if (present) set_app_data_dir(v);

    v = envString("GME_LOG_FILE", &present);
    if (present) set_log_path(v.trimmed());

    v = envString("GME_LOG_LEVEL", &present);
    if (present) {
        LogLevel lv;
        if (Logger::parse_level(v.trimmed().toStdString(), lv)) m_logLevel = lv;
        else Logger::warn("GME_LOG_LEVEL not recognised: " + v.toStdString(), "config");
    }
}

} // namespace gme

#pragma once
#include <QString>
#include <string>
#include "log/logger.h"

namespace gme {

// Client configuration. Built once at start-up (JSON file first, then
// GME_* environment overrides) and handed to the components that need it.
class Config {
public:
    static constexpr const char* kDefaultManagementUrl = "http://localhost:8000/api/v1";
    static constexpr const char* kDefaultVideoServiceUrl = "http://localhost:8001";
    static constexpr const char* kDefaultAudioServiceUrl = "http://localhost:8002";
    static constexpr const char* kDefaultCookieName = "session_token";
    static constexpr double kDefaultTimeoutSeconds = 15.0;
    // accepted request timeout range: 1 ms .. 1 day
    static constexpr double kMinTimeoutSeconds = 0.001;
    static constexpr double kMaxTimeoutSeconds = 86400.0;
    static constexpr int kMaxRetries = 10;
    static constexpr int kMaxRetryBackoffMs = 60000;

    Config();

    // Load a JSON config file; missing file or bad JSON keeps current values.
    bool load(const std::string& path);

    // Override from GME_* environment variables.
    void load_from_env();

    // Convenience used by main(): GME_CONFIG_FILE (if set) then environment.
    static Config fromEnvironment();

    QString management_url() const { return m_managementUrl; }
    QString video_service_url() const { return m_videoServiceUrl; }
    QString audio_service_url() const { return m_audioServiceUrl; }
    QString audio_service_api_key() const { return m_audioApiKey; }
    double timeout_seconds() const { return m_timeoutSeconds; }
    int timeout_ms() const;
    QString session_cookie_name() const { return m_cookieName; }
    int max_retries() const { return m_maxRetries; }
    int retry_backoff_ms() const { return m_retryBackoffMs; }
    QString app_data_dir() const { return m_appDataDir; }
    QString log_path() const { return m_logPath; }
    LogLevel log_level() const { return m_logLevel; }

    QString session_file_path() const;

    void set_management_url(const QString& url);
    void set_video_service_url(const QString& url);
    void set_audio_service_url(const QString& url);
    void set_audio_service_api_key(const QString& key) { m_audioApiKey = key; }
    void set_timeout_seconds(double seconds);
    void set_session_cookie_name(const QString& name);
    void set_max_retries(int retries);
    void set_retry_backoff_ms(int ms);
    void set_app_data_dir(const QString& dir);
    void set_log_path(const QString& path) { m_logPath = path; m_logPathExplicit = true; }
    void set_log_level(LogLevel level) { m_logLevel = level; }

    // "host:8000" -> "http://host:8000/api/v1"; explicit paths are kept.
    static QString normalizeManagementUrl(const QString& raw);
    static QString normalizeServiceUrl(const QString& raw, const QString& fallback);

private:
    static QString defaultAppDataDir();

private:
    QString m_managementUrl;
    QString m_videoServiceUrl;
    QString m_audioServiceUrl;
    QString m_audioApiKey;
    double m_timeoutSeconds = kDefaultTimeoutSeconds;
    QString m_cookieName;
    int m_maxRetries = 0;
    int m_retryBackoffMs = 500;
    QString m_appDataDir;
    QString m_logPath;
    bool m_logPathExplicit = false;
    LogLevel m_logLevel = LogLevel::Info;
};

} // namespace gme

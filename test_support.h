#pragma once
// Shared helpers for the client tests: an in-process backend built on
// cpp-httplib and an event-loop pump for Qt asynchrony.
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QString>
#include <QThread>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/config.h"

namespace test_support {

using json = nlohmann::json;

// Pump the Qt event loop until cond() holds or timeoutMs elapses.
inline bool waitUntil(const std::function<bool()>& cond, int timeoutMs = 5000) {
    QElapsedTimer t;
    t.start();
    while (!cond()) {
        if (t.elapsed() > timeoutMs) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
        QThread::msleep(2);
    }
    return true;
}

inline void spin(int ms) {
    QElapsedTimer t;
    t.start();
    while (t.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
        QThread::msleep(2);
    }
}

// Management, video and audio endpoints on one port, close enough to the
// real backend for the client's decoding paths.
class MockBackend {
public:
    struct Recorded {
        std::string method;
        std::string path;
        std::string cookie;
        std::string apiKey;
    };

    MockBackend() { setup_routes(); }
    ~MockBackend() { stop(); }

    bool start() {
        m_port = m_server.bind_to_any_port("127.0.0.1");
        if (m_port <= 0) return false;
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
        for (int i = 0; i < 200 && !m_server.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return m_server.is_running();
    }

    void stop() {
        if (m_thread.joinable()) {
            m_server.stop();
            m_thread.join();
        }
    }

    int port() const { return m_port; }
    QString baseUrl() const { return QString("http://127.0.0.1:%1").arg(m_port); }
    QString managementUrl() const { return baseUrl() + "/api/v1"; }

    // Config pointing every service at this backend.
    gme::Config config(const QString& dataDir, double timeoutSeconds = 5.0) const {
        gme::Config cfg;
        cfg.set_management_url(managementUrl());
        cfg.set_video_service_url(baseUrl());
        cfg.set_audio_service_url(baseUrl());
        cfg.set_app_data_dir(dataDir);
        cfg.set_timeout_seconds(timeoutSeconds);
        return cfg;
    }

    void addUser(const std::string& login, const std::string& password) {
        std::lock_guard<std::mutex> lk(m_mu);
        m_users[login] = password;
    }

    std::string addProject(const std::string& title, const std::string& description,
                           const std::string& status = "draft") {
        std::lock_guard<std::mutex> lk(m_mu);
        return add_project_locked(title, description, status, "");
    }

    std::string addRun(const std::string& projectId, const std::string& status,
                       const std::string& provider = "mock") {
        std::lock_guard<std::mutex> lk(m_mu);
        return add_run_locked(projectId, status, provider, "immediate");
    }

    void addAudioProvider(const json& provider) {
        std::lock_guard<std::mutex> lk(m_mu);
        m_providers.push_back(provider);
    }

    // Every request sleeps this long before answering.
    void setDelayMs(int ms) { m_delayMs = ms; }
    // Requests for this exact path sleep this long on top; 0 removes it.
    void setPathDelayMs(const std::string& path, int ms) {
        std::lock_guard<std::mutex> lk(m_mu);
        if (ms > 0) m_pathDelays[path] = ms;
        else m_pathDelays.erase(path);
    }
    // Authenticated endpoints answer 401 regardless of the cookie.
    void setForceUnauthorized(bool on) { m_forceUnauthorized = on; }
    // Next response for this exact path (any method) is replaced.
    void failNext(const std::string& path, int status, const std::string& body,
                  const std::string& contentType = "application/json") {
        std::lock_guard<std::mutex> lk(m_mu);
        m_failures[path] = Failure{status, body, contentType};
    }

    int hits(const std::string& path) const {
        std::lock_guard<std::mutex> lk(m_mu);
        int n = 0;
        for (const auto& r : m_requests) {
            if (r.path == path) ++n;
        }
        return n;
    }

    std::vector<Recorded> requests() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_requests;
    }

    std::string lastUploadName() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_lastUploadName;
    }

    std::string lastUploadContent() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_lastUploadContent;
    }

    json lastStartBody() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_lastStartBody;
    }

    size_t projectCount() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_projects.size();
    }

private:
    struct Failure {
        int status = 500;
        std::string body;
        std::string contentType;
    };

    static void send_json(httplib::Response& res, int status, const json& body) {
        res.status = status;
        res.set_content(body.dump(), "application/json");
    }

    static void send_detail(httplib::Response& res, int status, const std::string& detail) {
        send_json(res, status, json{{"detail", detail}});
    }

    std::string next_timestamp_locked() {
        // strictly increasing so "newest first" is well defined
        ++m_clock;
        char buf[32];
        std::snprintf(buf, sizeof(buf), "2026-10-19T08:%02d:%02dZ", (m_clock / 60) % 60, m_clock % 60);
        return buf;
    }

    std::string add_project_locked(const std::string& title, const std::string& description,
                                   const std::string& status, const std::string& videoPath) {
        const std::string id = "p" + std::to_string(++m_projectSeq);
        json p{{"id", id},
               {"creator_id", "u1"},
               {"title", title},
               {"description", description},
               {"status", status},
               {"created_at", next_timestamp_locked()},
               {"updated_at", nullptr}};
        p["video_path"] = videoPath.empty() ? json(nullptr) : json(videoPath);
        // newest first, like the backend
        m_projects.insert(m_projects.begin(), p);
        return id;
    }

    std::string add_run_locked(const std::string& projectId, const std::string& status,
                               const std::string& provider, const std::string& launchMode) {
        const std::string id = "r" + std::to_string(++m_runSeq);
        json r{{"id", id},
               {"project_id", projectId},
               {"video_task_id", "vt-" + id},
               {"provider", provider},
               {"status", status},
               {"launch_mode", launchMode},
               {"created_at", next_timestamp_locked()},
               {"updated_at", nullptr},
               {"completed_at", nullptr}};
        m_runs[projectId].insert(m_runs[projectId].begin(), r);
        return id;
    }

    std::string session_from_cookie(const httplib::Request& req) const {
        const std::string cookie = req.get_header_value("Cookie");
        const std::string key = "session_token=";
        const auto pos = cookie.find(key);
        if (pos == std::string::npos) return {};
        const auto end = cookie.find(';', pos);
        return cookie.substr(pos + key.size(), end == std::string::npos ? std::string::npos
                                                                          : end - pos - key.size());
    }

    // Returns true when the request was answered here.
    bool pre_handle(const httplib::Request& req, httplib::Response& res, bool needsSession) {
        int delay = m_delayMs.load();
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto d = m_pathDelays.find(req.path);
            if (d != m_pathDelays.end()) delay += d->second;
        }
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        std::lock_guard<std::mutex> lk(m_mu);
        m_requests.push_back(Recorded{req.method, req.path, req.get_header_value("Cookie"),
                                      req.get_header_value("X-API-Key")});

        auto f = m_failures.find(req.path);
        if (f != m_failures.end()) {
            res.status = f->second.status;
            res.set_content(f->second.body, f->second.contentType.c_str());
            m_failures.erase(f);
            return true;
        }
        if (needsSession) {
            const std::string token = session_from_cookie(req);
            if (m_forceUnauthorized || token.empty() || !m_sessions.count(token)) {
                send_detail(res, 401, "Not authenticated");
                return true;
            }
        }
        return false;
    }

    static int query_int(const httplib::Request& req, const char* key, int fallback) {
        if (!req.has_param(key)) return fallback;
        try {
            return std::stoi(req.get_param_value(key));
        } catch (const std::exception&) {
            return fallback;
        }
    }

    static json page_of(const std::vector<json>& all, int limit, int offset) {
        json items = json::array();
        for (int i = offset; i < static_cast<int>(all.size()) && i < offset + limit; ++i) {
            items.push_back(all[static_cast<size_t>(i)]);
        }
        return json{{"items", items}, {"total", all.size()}, {"limit", limit}, {"offset", offset}};
    }

    void setup_routes() {
        m_server.Post("/api/v1/auth/register", [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, false)) return;
            json body = json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.contains("login") || !body.contains("password")) {
                send_detail(res, 422, "login and password required");
                return;
            }
            std::lock_guard<std::mutex> lk(m_mu);
            const std::string login = body["login"].get<std::string>();
            if (m_users.count(login)) {
                send_json(res, 409, json{{"detail", "Login already taken"}, {"code", "login_taken"}});
                return;
            }
            m_users[login] = body["password"].get<std::string>();
            send_json(res, 201, json{{"id", "u-" + login}, {"login", login}});
        });

        m_server.Post("/api/v1/auth/login", [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, false)) return;
            json body = json::parse(req.body, nullptr, false);
            if (body.is_discarded()) {
                send_detail(res, 422, "invalid body");
                return;
            }
            std::lock_guard<std::mutex> lk(m_mu);
            const std::string login = body.value("login", "");
            auto it = m_users.find(login);
            if (it == m_users.end() || it->second != body.value("password", "")) {
                send_detail(res, 401, "Invalid credentials");
                return;
            }
            const std::string token = "tok-" + std::to_string(++m_tokenSeq);
            m_sessions[token] = login;
            res.set_header("Set-Cookie", "session_token=" + token + "; Path=/; HttpOnly");
            send_json(res, 200, json{{"user", {{"id", "u-" + login},
                                               {"login", login},
                                               {"role", "user"},
                                               {"must_change_password", false}}}});
        });

        m_server.Post("/api/v1/auth/logout", [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, false)) return;
            std::lock_guard<std::mutex> lk(m_mu);
            m_sessions.erase(session_from_cookie(req));
            res.status = 204;
        });

        m_server.Get("/api/v1/users/me", [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, true)) return;
            std::lock_guard<std::mutex> lk(m_mu);
            const std::string login = m_sessions[session_from_cookie(req)];
            send_json(res, 200, json{{"id", "u-" + login},
                                     {"login", login},
                                     {"email", login + "@example.com"},
                                     {"role", "user"},
                                     {"is_active", true},
                                     {"display_name", nullptr},
                                     {"created_at", "2026-10-01T10:00:00Z"}});
        });

        m_server.Get("/api/v1/projects", [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, true)) return;
            std::lock_guard<std::mutex> lk(m_mu);
            std::vector<json> matching;
            const std::string q = req.has_param("q") ? req.get_param_value("q") : "";
            for (const auto& p : m_projects) {
                if (q.empty() || p["title"].get<std::string>().find(q) != std::string::npos) {
                    matching.push_back(p);
                }
            }
            send_json(res, 200, page_of(matching, query_int(req, "limit", 100), query_int(req, "offset", 0)));
        });

        m_server.Post("/api/v1/projects", [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, true)) return;
            if (!req.is_multipart_form_data() || !req.has_file("title")) {
                send_detail(res, 422, "multipart form with title expected");
                return;
            }
            std::lock_guard<std::mutex> lk(m_mu);
            const std::string title = req.get_file_value("title").content;
            const std::string description =
                req.has_file("description") ? req.get_file_value("description").content : "";
            std::string videoPath;
            if (req.has_file("video")) {
                const auto video = req.get_file_value("video");
                m_lastUploadName = video.filename;
                m_lastUploadContent = video.content;
                videoPath = "uploads/" + video.filename;
            }
            const std::string id = add_project_locked(title, description, "draft", videoPath);
            const bool start = req.has_file("start_processing") &&
                               req.get_file_value("start_processing").content == "true";
            if (start) add_run_locked(id, "started", "mock", "immediate");
            send_json(res, 201, m_projects.front());
        });

        m_server.Post(R"(/api/v1/projects/([^/]+)/processing/start)",
                      [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, true)) return;
            std::lock_guard<std::mutex> lk(m_mu);
            const std::string projectId = req.matches[1];
            json body = json::parse(req.body, nullptr, false);
            m_lastStartBody = body;
            const std::string provider = (!body.is_discarded() && body.contains("audio_provider"))
                                             ? body["audio_provider"].get<std::string>()
                                             : "mock";
            const std::string launchMode = (!body.is_discarded() && body.contains("launch_mode"))
                                               ? body["launch_mode"].get<std::string>()
                                               : "immediate";
            add_run_locked(projectId, "started", provider, launchMode);
            send_json(res, 202, m_runs[projectId].front());
        });

        m_server.Get(R"(/api/v1/projects/([^/]+)/processing)",
                     [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, true)) return;
            std::lock_guard<std::mutex> lk(m_mu);
            const std::string projectId = req.matches[1];
            send_json(res, 200, page_of(m_runs[projectId], query_int(req, "limit", 20), query_int(req, "offset", 0)));
        });

        m_server.Get("/models", [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, false)) return;
            send_json(res, 200, json{{"models", {"emotion-base", "emotion-large"}}});
        });

        // JSON array streamed one element per chunk, gap_ms apart
        m_server.Get("/slow-stream", [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, false)) return;
            const int chunks = query_int(req, "chunks", 3);
            const int gapMs = query_int(req, "gap_ms", 100);
            res.status = 200;
            res.set_chunked_content_provider("application/json",
                [chunks, gapMs](size_t, httplib::DataSink& sink) {
                    sink.write("[", 1);
                    for (int i = 0; i < chunks; ++i) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(gapMs));
                        const std::string item = (i ? "," : "") + std::to_string(i);
                        sink.write(item.data(), item.size());
                    }
                    sink.write("]", 1);
                    sink.done();
                    return true;
                });
        });

        m_server.Get("/providers", [this](const httplib::Request& req, httplib::Response& res) {
            if (pre_handle(req, res, false)) return;
            std::lock_guard<std::mutex> lk(m_mu);
            json arr = json::array();
            for (const auto& p : m_providers) arr.push_back(p);
            send_json(res, 200, arr);
        });
    }

private:
    httplib::Server m_server;
    std::thread m_thread;
    int m_port = 0;

    mutable std::mutex m_mu;
    std::map<std::string, std::string> m_users;
    std::map<std::string, std::string> m_sessions;
    std::vector<json> m_projects;
    std::map<std::string, std::vector<json>> m_runs;
    std::vector<json> m_providers;
    std::map<std::string, Failure> m_failures;
    std::map<std::string, int> m_pathDelays;
    std::vector<Recorded> m_requests;
    std::string m_lastUploadName;
    std::string m_lastUploadContent;
    json m_lastStartBody;
    int m_projectSeq = 0;
    int m_runSeq = 0;
    int m_tokenSeq = 0;
    int m_clock = 0;

    std::atomic<int> m_delayMs{0};
    std::atomic<bool> m_forceUnauthorized{false};
};

} // namespace test_support

#pragma once
#include <QString>
#include <utility>

// Error taxonomy of every API call. Errors are values: a request either
// produces a decoded record or exactly one ApiError.
struct ApiError {
    enum class Kind {
        None,
        Auth,       // 401: bad credentials or expired session
        Network,    // service unreachable / transport failure
        Timeout,    // exceeded the configured request timeout
        Api         // non-2xx with backend message, or local precondition (status 0)
    };

    Kind kind = Kind::None;
    int httpStatus = 0;
    QString code;
    QString message;

    bool isError() const { return kind != Kind::None; }
    bool isAuth() const { return kind == Kind::Auth; }
    bool isTimeout() const { return kind == Kind::Timeout; }
    bool isNetwork() const { return kind == Kind::Network; }

    QString kindName() const;
    // "[404] not_found: Project not found"
    QString toString() const;

    static ApiError auth(int httpStatus, const QString& message, const QString& code = {});
    static ApiError network(const QString& message);
    static ApiError timeout(int timeoutMs);
    static ApiError api(int httpStatus, const QString& message, const QString& code = {});
};

template <typename T>
struct ApiResult {
    bool ok = false;
    T value{};
    ApiError error;

    static ApiResult success(T v)
    {
        ApiResult r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }

    static ApiResult failure(ApiError e)
    {
        ApiResult r;
        r.ok = false;
        r.error = std::move(e);
        return r;
    }
};

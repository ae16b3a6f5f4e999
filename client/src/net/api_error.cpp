#include "net/api_error.h"

QString ApiError::kindName() const
{
    switch (kind) {
    case Kind::None:    return "None";
    case Kind::Auth:    return "AuthError";
    case Kind::Network: return "NetworkError";
    case Kind::Timeout: return "TimeoutError";
    case Kind::Api:     return "ApiError";
    }
    return "ApiError";
}

QString ApiError::toString() const
{
    QString out;
    if (httpStatus > 0) out += QString("[%1] ").arg(httpStatus);
    if (!code.isEmpty()) out += code + ": ";
    out += message;
    return out;
}

ApiError ApiError::auth(int httpStatus, const QString& message, const QString& code)
{
    ApiError e;
    e.kind = Kind::Auth;
    e.httpStatus = httpStatus;
    e.message = message;
    e.code = code;
    return e;
}

ApiError ApiError::network(const QString& message)
{
    ApiError e;
    e.kind = Kind::Network;
    e.message = message;
    return e;
}

ApiError ApiError::timeout(int timeoutMs)
{
    ApiError e;
    e.kind = Kind::Timeout;
    e.message = QString("The server did not respond within %1 s.")
                    .arg(QString::number(timeoutMs / 1000.0, 'g', 3));
    return e;
}

ApiError ApiError::api(int httpStatus, const QString& message, const QString& code)
{
    ApiError e;
    e.kind = Kind::Api;
    e.httpStatus = httpStatus;
    e.message = message;
    e.code = code;
    return e;
}

#include "models/status_text.h"

namespace status_text {

QString projectLabel(const QString& status)
{
    const QString s = status.trimmed().toLower();
    if (s == "draft") return "Draft";
    if (s == "in_progress") return "In progress";
    if (s == "done") return "Done";
    if (s == "archived") return "Archived";
    return status.isEmpty() ? QStringLiteral("-") : status;
}

QColor projectColor(const QString& status)
{
    const QString s = status.trimmed().toLower();
    if (s == "draft") return QColor("#6b7280");
    if (s == "in_progress") return QColor("#1d4ed8");
    if (s == "done") return QColor("#047857");
    if (s == "archived") return QColor("#9ca3af");
    return {};
}

QString runLabel(const QString& status)
{
    const QString s = status.trimmed().toLower();
    if (s == "scheduled") return "Scheduled";
    if (s == "pending") return "Pending";
    if (s == "started") return "Started";
    if (s == "running") return "Running";
    if (s == "completed") return "Completed";
    if (s == "failed") return "Failed";
    if (s == "cancelled") return "Cancelled";
    return status.isEmpty() ? QStringLiteral("-") : status;
}

QColor runColor(const QString& status)
{
    const QString s = status.trimmed().toLower();
    if (s == "scheduled" || s == "pending") return QColor(Qt::gray);
    if (s == "started" || s == "running") return QColor(Qt::blue);
    if (s == "completed") return QColor(Qt::darkGreen);
    if (s == "failed") return QColor(Qt::red);
    if (s == "cancelled") return QColor(Qt::darkYellow);
    return {};
}

QString processingModeLabel(const QString& mode)
{
    if (mode == "video_only") return "Video only";
    if (mode == "audio_only") return "Audio only";
    if (mode == "audio_and_video") return "Video + audio";
    return mode;
}

} // namespace status_text

#include "models/processing_run.h"
#include <QJsonArray>
#include <QJsonObject>
#include <QStringList>
#include "models/json_fields.h"

ProcessingRun ProcessingRun::fromJson(const QJsonObject& obj)
{
    ProcessingRun r;
    r.id = json_fields::idString(obj.value("id"));
    r.projectId = json_fields::idString(obj.value("project_id"));
    r.videoTaskId = json_fields::idString(obj.value("video_task_id"));
    r.provider = json_fields::optString(obj, "provider");
    r.status = obj.value("status").toString();
    r.launchMode = json_fields::optString(obj, "launch_mode");
    r.startedAt = json_fields::parseDateTime(obj.value("created_at"));
    r.updatedAt = json_fields::parseDateTime(obj.value("updated_at"));
    r.completedAt = json_fields::parseDateTime(obj.value("completed_at"));

    r.resultSummary = json_fields::optString(obj, "result_summary");
    if (r.resultSummary.isEmpty()) {
        QStringList parts;
        if (!r.provider.isEmpty()) parts << r.provider;
        if (!r.launchMode.isEmpty()) parts << r.launchMode;
        r.resultSummary = parts.isEmpty() ? QStringLiteral("-") : parts.join(" / ");
    }
    return r;
}

ProcessingRunsPage processingRunsPageFromJson(const QJsonObject& obj)
{
    ProcessingRunsPage page;
    for (const auto& item : obj.value("items").toArray()) {
        if (!item.isObject()) continue;
        page.items.append(ProcessingRun::fromJson(item.toObject()));
    }
    page.total = obj.value("total").toInt(page.items.size());
    page.limit = obj.value("limit").toInt(0);
    page.offset = obj.value("offset").toInt(0);
    return page;
}

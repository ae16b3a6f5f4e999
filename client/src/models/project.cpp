#include "models/project.h"
#include <QJsonArray>
#include <QJsonObject>
#include "models/json_fields.h"

Project Project::fromJson(const QJsonObject& obj)
{
    Project p;
    p.id = json_fields::idString(obj.value("id"));
    p.creatorId = json_fields::idString(obj.value("creator_id"));
    p.name = obj.value("title").toString();
    p.description = json_fields::optString(obj, "description");
    p.status = obj.value("status").toString();
    p.videoReference = json_fields::optString(obj, "video_path");
    p.createdAt = json_fields::parseDateTime(obj.value("created_at"));
    p.updatedAt = json_fields::parseDateTime(obj.value("updated_at"));
    return p;
}

ProjectsPage projectsPageFromJson(const QJsonObject& obj)
{
    ProjectsPage page;
    for (const auto& item : obj.value("items").toArray()) {
        if (!item.isObject()) continue;
        page.items.append(Project::fromJson(item.toObject()));
    }
    page.total = obj.value("total").toInt(page.items.size());
    page.limit = obj.value("limit").toInt(0);
    page.offset = obj.value("offset").toInt(0);
    return page;
}

#pragma once
#include <QDateTime>
#include <QList>
#include <QString>

class QJsonObject;

struct Project {
    QString id;
    QString creatorId;
    QString name;             // "title" on the wire
    QString description;
    QString status;           // draft / in_progress / done / archived
    QString videoReference;   // "video_path" on the wire
    QDateTime createdAt;
    QDateTime updatedAt;

    bool isActive() const { return status == "draft" || status == "in_progress"; }

    static Project fromJson(const QJsonObject& obj);
};

template <typename T>
struct Page {
    QList<T> items;
    int total = 0;
    int limit = 0;
    int offset = 0;
};

using ProjectsPage = Page<Project>;

ProjectsPage projectsPageFromJson(const QJsonObject& obj);

#pragma once
#include <QDateTime>
#include <QString>
#include "models/project.h"

class QJsonObject;

struct ProcessingRun {
    QString id;
    QString projectId;
    QString videoTaskId;
    QString provider;
    QString status;           // scheduled / pending / started / running / completed / failed / cancelled
    QString launchMode;
    QString resultSummary;
    QDateTime startedAt;      // "created_at" on the wire
    QDateTime updatedAt;
    QDateTime completedAt;

    static ProcessingRun fromJson(const QJsonObject& obj);
};

using ProcessingRunsPage = Page<ProcessingRun>;

ProcessingRunsPage processingRunsPageFromJson(const QJsonObject& obj);

#pragma once
#include <QList>
#include <QString>

class QJsonArray;
class QJsonObject;

struct AudioProvider {
    QString code;
    QString title;
    bool supportsAudio = false;
    bool supportsVideo = false;
    bool isVideoProvider = false;

    static AudioProvider fromJson(const QJsonObject& obj);
};

QList<AudioProvider> audioProvidersFromJson(const QJsonArray& arr);

// Providers usable for a processing mode ("video_only", "audio_only",
// "audio_and_video"). For audio_and_video dedicated video providers win,
// otherwise anything that supports video is offered.
QList<AudioProvider> providersForMode(const QList<AudioProvider>& all, const QString& mode);

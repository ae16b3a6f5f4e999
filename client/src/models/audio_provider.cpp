#include "models/audio_provider.h"
#include <QJsonArray>
#include <QJsonObject>

AudioProvider AudioProvider::fromJson(const QJsonObject& obj)
{
    AudioProvider p;
    p.code = obj.value("code").toString().trimmed().toLower();
    p.title = obj.value("title").toString();
    if (p.title.isEmpty()) p.title = p.code;
    p.supportsAudio = obj.value("supports_audio").toBool(false);
    p.supportsVideo = obj.value("supports_video").toBool(false);
    p.isVideoProvider = obj.value("is_video_provider").toBool(false);
    return p;
}

QList<AudioProvider> audioProvidersFromJson(const QJsonArray& arr)
{
    QList<AudioProvider> out;
    for (const auto& v : arr) {
        if (!v.isObject()) continue;
        AudioProvider p = AudioProvider::fromJson(v.toObject());
        if (!p.code.isEmpty()) out.append(p);
    }
    return out;
}

QList<AudioProvider> providersForMode(const QList<AudioProvider>& all, const QString& mode)
{
    QList<AudioProvider> out;
    if (mode == "audio_and_video") {
        for (const auto& p : all) {
            if (p.isVideoProvider) out.append(p);
        }
        if (out.isEmpty()) {
            for (const auto& p : all) {
                if (p.supportsVideo) out.append(p);
            }
        }
    } else if (mode == "audio_only") {
        for (const auto& p : all) {
            if (p.supportsAudio) out.append(p);
        }
    } else {
        for (const auto& p : all) {
            if (p.supportsAudio || p.supportsVideo) out.append(p);
        }
    }
    return out;
}

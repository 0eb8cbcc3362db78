#pragma once

#include <QList>
#include <QObject>
#include <QPointer>

#include "reminder/audio/SoundPlayer.hpp"

class QSoundEffect;

namespace reminder {
namespace audio {

// Plays WAV files with QSoundEffect. Effects are created on this object's
// thread; playAsync() only posts the request there.
class QtSoundPlayer : public QObject, public SoundPlayer
{
    Q_OBJECT

public:
    explicit QtSoundPlayer(QObject *parent = nullptr);
    ~QtSoundPlayer() override;

    void playAsync(const QString &soundRef) override;
    void stopAll() override;

    int activeCount() const;

signals:
    void playbackFailed(const QString &soundRef, const QString &reason);

private:
    void startPlayback(const QString &soundRef);
    void finishPlayback(QSoundEffect *effect);

    QList<QPointer<QSoundEffect>> m_effects;
};

} // namespace audio
} // namespace reminder

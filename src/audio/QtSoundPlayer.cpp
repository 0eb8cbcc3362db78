#include "reminder/audio/QtSoundPlayer.hpp"

#include <QFileInfo>
#include <QSoundEffect>
#include <QUrl>

#include "reminder/core/Errors.hpp"
#include "reminder/core/Logging.hpp"

namespace reminder {
namespace audio {

namespace {
QUrl soundUrl(const QString &soundRef)
{
    if (soundRef.startsWith(QLatin1String("qrc:")) || soundRef.startsWith(QLatin1String("file:"))) {
        return QUrl(soundRef);
    }
    return QUrl::fromLocalFile(soundRef);
}
} // namespace

QtSoundPlayer::QtSoundPlayer(QObject *parent)
    : QObject(parent)
{
}

QtSoundPlayer::~QtSoundPlayer()
{
    stopAll();
}

void QtSoundPlayer::playAsync(const QString &soundRef)
{
    QMetaObject::invokeMethod(
        this, [this, soundRef]() { startPlayback(soundRef); }, Qt::QueuedConnection);
}

void QtSoundPlayer::stopAll()
{
    const auto effects = m_effects;
    m_effects.clear();
    for (const auto &effect : effects) {
        if (effect) {
            effect->stop();
            effect->deleteLater();
        }
    }
}

int QtSoundPlayer::activeCount() const
{
    return m_effects.size();
}

void QtSoundPlayer::startPlayback(const QString &soundRef)
{
    const QUrl url = soundUrl(soundRef);
    if (url.isLocalFile() && !QFileInfo::exists(url.toLocalFile())) {
        const QString reason = tr("Sound file not found: %1").arg(url.toLocalFile());
        qCWarning(lcAudio) << core::errorKindName(core::ErrorKind::PlaybackFailure) << reason;
        emit playbackFailed(soundRef, reason);
        return;
    }

    auto *effect = new QSoundEffect(this);
    m_effects.append(effect);
    connect(effect, &QSoundEffect::statusChanged, this, [this, effect, soundRef]() {
        if (effect->status() == QSoundEffect::Error) {
            const QString reason = tr("Cannot play %1").arg(soundRef);
            qCWarning(lcAudio) << core::errorKindName(core::ErrorKind::PlaybackFailure) << reason;
            emit playbackFailed(soundRef, reason);
            finishPlayback(effect);
        }
    });
    connect(effect, &QSoundEffect::playingChanged, this, [this, effect]() {
        if (!effect->isPlaying() && effect->status() == QSoundEffect::Ready) {
            finishPlayback(effect);
        }
    });
    effect->setSource(url);
    effect->play();
    qCDebug(lcAudio) << "playing" << url;
}

void QtSoundPlayer::finishPlayback(QSoundEffect *effect)
{
    m_effects.removeAll(effect);
    effect->deleteLater();
}

} // namespace audio
} // namespace reminder

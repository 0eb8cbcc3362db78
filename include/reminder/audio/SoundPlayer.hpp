#pragma once

#include <QString>

namespace reminder {
namespace audio {

// Fire-and-forget playback. Implementations may be called from any thread
// and report failures through logging only.
class SoundPlayer
{
public:
    virtual ~SoundPlayer() = default;

    virtual void playAsync(const QString &soundRef) = 0;
    virtual void stopAll() = 0;
};

} // namespace audio
} // namespace reminder

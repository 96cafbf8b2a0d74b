#pragma once

#include <QtCore/QString>
#include <QtCore/QtGlobal>
#include <vector>

#include "../common/Expected.hpp"

namespace VoiceScribe {

// Mono, 16 kHz, signed 16-bit samples
using PcmBuffer = std::vector<qint16>;

enum class AudioError {
    FileNotFound,
    PermissionDenied,
    InvalidFile,
    NoAudioStream,
    DecoderUnavailable,
    DecodingFailed,
    ResamplingFailed,
    InvalidRange
};

QString audioErrorToString(AudioError error);

/**
 * @brief Decode primitive used by segmentation and chunk execution
 *
 * Implementations must report failures as errors; an empty buffer is never
 * a successful result.
 */
class AudioDecoder {
public:
    static constexpr int SampleRate = 16000;

    virtual ~AudioDecoder() = default;

    virtual Expected<double, AudioError> probeDuration(const QString& filePath) = 0;

    // Decode [startSeconds, startSeconds + durationSeconds) to PcmBuffer
    virtual Expected<PcmBuffer, AudioError> extractPcm(const QString& filePath,
                                                       double startSeconds,
                                                       double durationSeconds) = 0;
};

} // namespace VoiceScribe

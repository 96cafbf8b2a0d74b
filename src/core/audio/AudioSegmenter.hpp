#pragma once

#include <QtCore/QString>
#include <vector>

#include "AudioDecoder.hpp"
#include "../common/Config.hpp"
#include "../common/Expected.hpp"

namespace VoiceScribe {

class SpeechModel;

// One fixed-size transcription window; recomputed per run, never stored
struct AudioChunkSpec {
    int index = 0;
    double startSeconds = 0.0;
    double durationSeconds = 0.0;
};

struct DetectionWindow {
    double startSeconds = 0.0;
    double durationSeconds = 0.0;
};

/**
 * @brief Splits audio into transcription windows and picks the language
 * detection sample
 *
 * Short files (under one detection window) are sampled from the start. Longer
 * files are sampled around the midpoint so intros and leading silence do not
 * skew detection.
 */
class AudioSegmenter {
public:
    AudioSegmenter(AudioDecoder& decoder, const Config::TranscriptionSettings& settings);

    Expected<double, AudioError> duration(const QString& audioPath) const;

    DetectionWindow detectionWindow(double durationSeconds) const;

    int chunkCount(double durationSeconds) const;
    AudioChunkSpec chunkAt(int index, double durationSeconds) const;
    std::vector<AudioChunkSpec> planChunks(double durationSeconds) const;

    Expected<PcmBuffer, AudioError> extractChunk(const QString& audioPath, const AudioChunkSpec& chunk) const;
    Expected<PcmBuffer, AudioError> extractDetectionSample(const QString& audioPath, double durationSeconds) const;

    /**
     * @brief Best-effort language detection
     * @return Detected code, or the default language when decoding or
     *         detection fails
     */
    QString detectLanguage(const QString& audioPath, double durationSeconds, SpeechModel& model) const;

    QString defaultLanguage() const { return settings_.defaultLanguage; }

private:
    AudioDecoder& decoder_;
    Config::TranscriptionSettings settings_;
};

} // namespace VoiceScribe

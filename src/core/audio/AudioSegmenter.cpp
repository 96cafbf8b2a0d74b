#include "AudioSegmenter.hpp"
#include "../common/Logger.hpp"
#include "../transcription/SpeechModel.hpp"

#include <algorithm>
#include <cmath>

namespace VoiceScribe {

AudioSegmenter::AudioSegmenter(AudioDecoder& decoder, const Config::TranscriptionSettings& settings)
    : decoder_(decoder)
    , settings_(settings) {
}

Expected<double, AudioError> AudioSegmenter::duration(const QString& audioPath) const {
    auto result = decoder_.probeDuration(audioPath);
    if (result.hasError()) {
        Logger::instance().error("Cannot read duration of {}: {}",
                                 audioPath.toStdString(),
                                 audioErrorToString(result.error()).toStdString());
        return result;
    }
    if (result.value() <= 0.0) {
        return makeUnexpected(AudioError::InvalidFile);
    }
    return result;
}

DetectionWindow AudioSegmenter::detectionWindow(double durationSeconds) const {
    const double window = settings_.detectionWindowSeconds;
    DetectionWindow result;
    if (durationSeconds < window) {
        result.startSeconds = 0.0;
        result.durationSeconds = std::max(0.0, durationSeconds);
    } else {
        result.startSeconds = durationSeconds / 2.0 - window / 2.0;
        result.durationSeconds = window;
    }
    return result;
}

int AudioSegmenter::chunkCount(double durationSeconds) const {
    if (durationSeconds <= 0.0 || settings_.chunkSeconds <= 0.0) {
        return 0;
    }
    return static_cast<int>(std::ceil(durationSeconds / settings_.chunkSeconds));
}

AudioChunkSpec AudioSegmenter::chunkAt(int index, double durationSeconds) const {
    AudioChunkSpec chunk;
    chunk.index = index;
    chunk.startSeconds = index * settings_.chunkSeconds;
    chunk.durationSeconds = std::max(0.0, std::min(settings_.chunkSeconds, durationSeconds - chunk.startSeconds));
    return chunk;
}

std::vector<AudioChunkSpec> AudioSegmenter::planChunks(double durationSeconds) const {
    std::vector<AudioChunkSpec> chunks;
    const int count = chunkCount(durationSeconds);
    chunks.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        chunks.push_back(chunkAt(i, durationSeconds));
    }
    return chunks;
}

Expected<PcmBuffer, AudioError> AudioSegmenter::extractChunk(const QString& audioPath, const AudioChunkSpec& chunk) const {
    return decoder_.extractPcm(audioPath, chunk.startSeconds, chunk.durationSeconds);
}

Expected<PcmBuffer, AudioError> AudioSegmenter::extractDetectionSample(const QString& audioPath, double durationSeconds) const {
    const DetectionWindow window = detectionWindow(durationSeconds);
    if (window.durationSeconds <= 0.0) {
        return makeUnexpected(AudioError::InvalidRange);
    }
    return decoder_.extractPcm(audioPath, window.startSeconds, window.durationSeconds);
}

QString AudioSegmenter::detectLanguage(const QString& audioPath, double durationSeconds, SpeechModel& model) const {
    auto sample = extractDetectionSample(audioPath, durationSeconds);
    if (sample.hasError()) {
        Logger::instance().warn("Language detection sample unavailable ({}), using '{}'",
                                audioErrorToString(sample.error()).toStdString(),
                                settings_.defaultLanguage.toStdString());
        return settings_.defaultLanguage;
    }

    auto detected = model.detectLanguage(sample.value());
    if (detected.hasError()) {
        Logger::instance().warn("Language detection failed ({}), using '{}'",
                                speechModelErrorToString(detected.error()).toStdString(),
                                settings_.defaultLanguage.toStdString());
        return settings_.defaultLanguage;
    }

    const QString language = detected.value().trimmed().toLower();
    if (language.isEmpty() || language == "auto" || language == "unknown") {
        return settings_.defaultLanguage;
    }

    Logger::instance().info("Detected language '{}' for {}", language.toStdString(), audioPath.toStdString());
    return language;
}

} // namespace VoiceScribe

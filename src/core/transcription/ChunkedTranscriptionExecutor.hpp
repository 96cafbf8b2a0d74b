#pragma once

#include <QtCore/QString>
#include <atomic>
#include <functional>

#include "TranscriptionTypes.hpp"
#include "../audio/AudioSegmenter.hpp"
#include "../common/Config.hpp"
#include "../common/Expected.hpp"

namespace VoiceScribe {

class AudioDecoder;
class SpeechModel;

struct ExecutionRequest {
    QString audioPath;
    QString transcriptId;
    double durationSeconds = 0.0;
    // Resolved language code; the default language is sent as no hint
    QString language;
};

struct ExecutionResult {
    QString transcriptPath;
    int totalChunks = 0;
    int completedChunks = 0;
    int failedChunks = 0;
    bool cancelled = false;
};

struct ChunkProgress {
    int currentChunk = 0;
    int totalChunks = 0;
    int completedChunks = 0;
    QString message;
};

using ChunkProgressCallback = std::function<void(const ChunkProgress&)>;

/**
 * @brief Runs the speech model over fixed-size windows of one file
 *
 * Windows are processed strictly in order and appended to the transcript as
 * they finish. A window that fails to decode or transcribe is replaced by an
 * inline error marker; only an unusable transcript file aborts the run.
 */
class ChunkedTranscriptionExecutor {
public:
    ChunkedTranscriptionExecutor(AudioDecoder& decoder,
                                 SpeechModel& model,
                                 const Config::TranscriptionSettings& settings);

    Expected<ExecutionResult, TranscriptionError> execute(const ExecutionRequest& request,
                                                          const ChunkProgressCallback& onProgress,
                                                          const std::atomic<bool>& cancelRequested);

    QString languageHint(const QString& language) const;
    QString transcriptPath(const QString& transcriptId) const;

    static QString errorMarker(double lengthSeconds, const QString& reason);

private:
    Expected<QString, QString> transcribeChunk(const QString& audioPath,
                                               const AudioChunkSpec& chunk,
                                               const QString& hint);

    AudioSegmenter segmenter_;
    SpeechModel& model_;
    Config::TranscriptionSettings settings_;
};

} // namespace VoiceScribe

#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QMetaType>
#include <QtCore/QString>

namespace VoiceScribe {

enum class TranscriptionState {
    Ready,
    Preparing,
    DetectingLanguage,
    Transcribing,
    PostProcessing,
    Completed,
    Failed,
    Cancelled
};

enum class TranscriptionError {
    InvalidTransition,
    AudioUnreadable,
    ChunkTranscriptionError,
    ModelNotFound,
    ModelNotDownloaded,
    DownloadFailed,
    IntegrityCheckFailed,
    Cancelled,
    JobAlreadyActive,
    ModelLoadFailed,
    SinkUnavailable
};

QString stateToString(TranscriptionState state);
QString errorToString(TranscriptionError error);

// Fields a caller may attach to a transition
struct ProgressUpdate {
    int percentage = 0;
    QString message;
    int currentChunk = 0;
    int totalChunks = 0;
    // Seconds, -1 when unknown
    int estimatedTimeRemaining = -1;
};

// Snapshot of one job; replaced as a whole on every transition
struct TranscriptionProgress {
    TranscriptionState state = TranscriptionState::Ready;
    int percentage = 0;
    int currentChunk = 0;
    int totalChunks = 0;
    int estimatedTimeRemaining = -1;
    QString message;
    QDateTime timestamp;
};

/**
 * @brief Job-visible event delivered to the UI or CLI
 *
 * transcriptPath is filled once the sink is open; detectedLanguage once
 * detection finished or was skipped.
 */
struct TranscriptionEvent {
    QString jobId;
    TranscriptionState state = TranscriptionState::Ready;
    int percentage = 0;
    int currentChunk = 0;
    int totalChunks = 0;
    QString message;
    QString detectedLanguage;
    QString transcriptPath;
    // Set when the job entered Preparing
    QDateTime startedAt;

    bool isTerminal() const {
        return state == TranscriptionState::Completed ||
               state == TranscriptionState::Failed ||
               state == TranscriptionState::Cancelled;
    }
};

} // namespace VoiceScribe

Q_DECLARE_METATYPE(VoiceScribe::TranscriptionEvent)

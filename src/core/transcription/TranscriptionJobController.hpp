#pragma once

#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <functional>
#include <memory>

#include "SpeechModel.hpp"
#include "TranscriptionTypes.hpp"
#include "../common/Config.hpp"
#include "../common/Expected.hpp"
#include "../models/ModelDownloadWorker.hpp"

namespace VoiceScribe {

class AudioDecoder;
class ModelAssetManager;

struct TranscriptionRequest {
    QString audioPath;
    QString modelId;
    // Names the transcript file; derived from audioPath when empty
    QString jobId;
    // Empty or "auto" runs language detection
    QString language;
    bool allowModelDownload = true;
};

using SpeechModelFactory =
    std::function<Expected<std::unique_ptr<SpeechModel>, SpeechModelError>(const QString& modelPath)>;

/**
 * @brief Owns the single active transcription job
 *
 * startJob() moves the job to Preparing on the calling thread and runs the
 * rest in a background task: model gate (and download), duration probe,
 * language detection, chunked transcription, post-processing. Every state
 * change is published through jobEvent(); the terminal event is published
 * exactly once, after the controller has become idle.
 */
class TranscriptionJobController : public QObject {
    Q_OBJECT

public:
    TranscriptionJobController(ModelAssetManager& assets,
                               std::shared_ptr<AudioDecoder> decoder,
                               SpeechModelFactory modelFactory,
                               const Config::TranscriptionSettings& settings,
                               QObject* parent = nullptr);
    ~TranscriptionJobController() override;

    /**
     * @brief Start a job
     * @return The job id, or JobAlreadyActive while another job runs
     */
    Expected<QString, TranscriptionError> startJob(const TranscriptionRequest& request);

    // Cooperative; takes effect between chunks or download reads
    void cancelJob();

    bool isJobActive() const;
    QString currentJobId() const;
    TranscriptionState jobState() const;
    TranscriptionProgress jobProgress() const;
    QList<TranscriptionProgress> jobHistory() const;
    QString detectedLanguage() const;
    QString transcriptPath() const;
    QDateTime jobStartedAt() const;

    // Reason for the last Failed state
    TranscriptionError lastError() const;

    // Terminal -> Ready; rejected while a job runs
    Expected<void, TranscriptionError> resetJob();

    // Block until the background task returned
    void waitForIdle();

    // SHA-1 hex of the canonical audio path, so a recording keeps its transcript
    static QString recordingId(const QString& audioPath);

    static SpeechModelFactory whisperModelFactory(int threads);

signals:
    void jobEvent(const VoiceScribe::TranscriptionEvent& event);
    void modelDownloadProgress(const VoiceScribe::DownloadProgress& progress);
    void modelDownloadCompleted(const QString& modelId, bool success, const QString& message);

private:
    void runJob(const TranscriptionRequest& request);
    Expected<QString, TranscriptionError> ensureModel(const TranscriptionRequest& request);
    Expected<QString, TranscriptionError> downloadModel(const QString& modelId);

    bool advance(TranscriptionState state, const ProgressUpdate& update);
    void publish();
    TranscriptionEvent currentEvent() const;
    void failJob(TranscriptionError error, const QString& message);
    void finishJob(TranscriptionState terminal, const ProgressUpdate& update);
    bool cancelIfRequested();

    struct TranscriptionJobControllerPrivate;
    std::unique_ptr<TranscriptionJobControllerPrivate> d;
};

} // namespace VoiceScribe

#include "TranscriptionJobController.hpp"
#include "ChunkedTranscriptionExecutor.hpp"
#include "TranscriptionStateMachine.hpp"
#include "WhisperSpeechModel.hpp"
#include "../audio/AudioDecoder.hpp"
#include "../audio/AudioSegmenter.hpp"
#include "../common/Logger.hpp"
#include "../models/ModelAssetManager.hpp"
#include "../models/ModelRegistry.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QCryptographicHash>
#include <QtCore/QFileInfo>
#include <QtCore/QFuture>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QElapsedTimer>
#include <atomic>

namespace VoiceScribe {

namespace {

// Percentage bands per state
constexpr int DetectionPercent = 5;
constexpr int TranscriptionStartPercent = 10;
constexpr int TranscriptionEndPercent = 95;

}

struct TranscriptionJobController::TranscriptionJobControllerPrivate {
    TranscriptionJobControllerPrivate(ModelAssetManager& assetManager,
                                      std::shared_ptr<AudioDecoder> audioDecoder,
                                      SpeechModelFactory factory,
                                      const Config::TranscriptionSettings& transcriptionSettings)
        : assets(assetManager)
        , decoder(std::move(audioDecoder))
        , modelFactory(std::move(factory))
        , settings(transcriptionSettings) {
    }

    ModelAssetManager& assets;
    std::shared_ptr<AudioDecoder> decoder;
    SpeechModelFactory modelFactory;
    Config::TranscriptionSettings settings;

    TranscriptionStateMachine machine;
    std::atomic<bool> running{false};
    std::atomic<bool> cancelRequested{false};
    QFuture<void> future;

    mutable QMutex mutex;
    QString jobId;
    QString detectedLanguage;
    QString transcriptPath;
    QDateTime startedAt;
    TranscriptionError lastError = TranscriptionError::Cancelled;
    // Failure text from the model gate, written and read on the job thread
    QString gateFailure;
    ModelDownloadWorker* activeDownload = nullptr;
};

TranscriptionJobController::TranscriptionJobController(ModelAssetManager& assets,
                                                       std::shared_ptr<AudioDecoder> decoder,
                                                       SpeechModelFactory modelFactory,
                                                       const Config::TranscriptionSettings& settings,
                                                       QObject* parent)
    : QObject(parent)
    , d(std::make_unique<TranscriptionJobControllerPrivate>(assets, std::move(decoder),
                                                            std::move(modelFactory), settings)) {
    qRegisterMetaType<VoiceScribe::TranscriptionEvent>("VoiceScribe::TranscriptionEvent");
    qRegisterMetaType<VoiceScribe::DownloadProgress>("VoiceScribe::DownloadProgress");
}

TranscriptionJobController::~TranscriptionJobController() {
    cancelJob();
    waitForIdle();
}

Expected<QString, TranscriptionError> TranscriptionJobController::startJob(const TranscriptionRequest& request) {
    bool idle = false;
    if (!d->running.compare_exchange_strong(idle, true)) {
        Logger::instance().warn("Rejected transcription request: job {} is still running",
                                currentJobId().toStdString());
        return makeUnexpected(TranscriptionError::JobAlreadyActive);
    }

    // The previous task may still be returning after its terminal event
    d->future.waitForFinished();

    if (d->machine.isTerminal()) {
        auto restarted = d->machine.transitionTo(TranscriptionState::Ready);
        if (restarted.hasError()) {
            d->running = false;
            return makeUnexpected(restarted.error());
        }
    }

    ProgressUpdate preparing;
    preparing.message = TranscriptionStateMachine::defaultMessage(TranscriptionState::Preparing, 0);
    auto transition = d->machine.transitionTo(TranscriptionState::Preparing, preparing);
    if (transition.hasError()) {
        d->running = false;
        return makeUnexpected(transition.error());
    }

    TranscriptionRequest job = request;
    if (job.jobId.isEmpty()) {
        job.jobId = recordingId(job.audioPath);
    }

    {
        QMutexLocker locker(&d->mutex);
        d->jobId = job.jobId;
        d->startedAt = d->machine.progress().timestamp;
        d->detectedLanguage.clear();
        d->transcriptPath.clear();
    }
    d->gateFailure.clear();
    d->cancelRequested = false;

    Logger::instance().info("Starting transcription job {} for {} with model '{}'",
                            job.jobId.toStdString(), job.audioPath.toStdString(), job.modelId.toStdString());
    publish();

    d->future = QtConcurrent::run([this, job]() {
        runJob(job);
    });
    return job.jobId;
}

void TranscriptionJobController::cancelJob() {
    if (!d->running.load()) {
        return;
    }

    d->cancelRequested = true;
    QMutexLocker locker(&d->mutex);
    if (d->activeDownload) {
        d->activeDownload->cancel();
    }
    Logger::instance().info("Cancellation requested for job {}", d->jobId.toStdString());
}

bool TranscriptionJobController::isJobActive() const {
    return d->running.load();
}

QString TranscriptionJobController::currentJobId() const {
    QMutexLocker locker(&d->mutex);
    return d->jobId;
}

TranscriptionState TranscriptionJobController::jobState() const {
    return d->machine.state();
}

TranscriptionProgress TranscriptionJobController::jobProgress() const {
    return d->machine.progress();
}

QList<TranscriptionProgress> TranscriptionJobController::jobHistory() const {
    return d->machine.history();
}

QString TranscriptionJobController::detectedLanguage() const {
    QMutexLocker locker(&d->mutex);
    return d->detectedLanguage;
}

QString TranscriptionJobController::transcriptPath() const {
    QMutexLocker locker(&d->mutex);
    return d->transcriptPath;
}

QDateTime TranscriptionJobController::jobStartedAt() const {
    QMutexLocker locker(&d->mutex);
    return d->startedAt;
}

TranscriptionError TranscriptionJobController::lastError() const {
    QMutexLocker locker(&d->mutex);
    return d->lastError;
}

Expected<void, TranscriptionError> TranscriptionJobController::resetJob() {
    if (d->running.load()) {
        return makeUnexpected(TranscriptionError::JobAlreadyActive);
    }
    d->future.waitForFinished();

    if (d->machine.state() != TranscriptionState::Ready) {
        auto result = d->machine.transitionTo(TranscriptionState::Ready);
        if (result.hasError()) {
            return result;
        }
    }

    QMutexLocker locker(&d->mutex);
    d->detectedLanguage.clear();
    d->transcriptPath.clear();
    d->startedAt = QDateTime();
    return {};
}

void TranscriptionJobController::waitForIdle() {
    d->future.waitForFinished();
}

QString TranscriptionJobController::recordingId(const QString& audioPath) {
    const QFileInfo info(audioPath);
    QString key = info.canonicalFilePath();
    if (key.isEmpty()) {
        key = info.absoluteFilePath();
    }
    return QString::fromLatin1(QCryptographicHash::hash(key.toUtf8(), QCryptographicHash::Sha1).toHex());
}

SpeechModelFactory TranscriptionJobController::whisperModelFactory(int threads) {
    return [threads](const QString& modelPath) -> Expected<std::unique_ptr<SpeechModel>, SpeechModelError> {
        auto model = WhisperSpeechModel::load(modelPath, threads);
        if (model.hasError()) {
            return makeUnexpected(model.error());
        }
        return std::unique_ptr<SpeechModel>(std::move(model).value());
    };
}

void TranscriptionJobController::runJob(const TranscriptionRequest& request) {
    QElapsedTimer jobTimer;
    jobTimer.start();

    auto modelPath = ensureModel(request);
    if (modelPath.hasError()) {
        if (modelPath.error() == TranscriptionError::Cancelled) {
            finishJob(TranscriptionState::Cancelled, ProgressUpdate{0, "Transcription cancelled"});
        } else {
            failJob(modelPath.error(), d->gateFailure);
        }
        return;
    }
    if (cancelIfRequested()) {
        return;
    }

    auto model = d->modelFactory(modelPath.value());
    if (model.hasError()) {
        failJob(TranscriptionError::ModelLoadFailed,
                QString("%1: %2").arg(errorToString(TranscriptionError::ModelLoadFailed),
                                      speechModelErrorToString(model.error())));
        return;
    }
    std::unique_ptr<SpeechModel> speechModel = std::move(model).value();

    AudioSegmenter segmenter(*d->decoder, d->settings);
    auto duration = segmenter.duration(request.audioPath);
    if (duration.hasError()) {
        failJob(TranscriptionError::AudioUnreadable, audioErrorToString(duration.error()));
        return;
    }
    if (cancelIfRequested()) {
        return;
    }

    const QString requestedLanguage = request.language.trimmed().toLower();
    QString language;
    if (!requestedLanguage.isEmpty() && requestedLanguage != "auto") {
        language = requestedLanguage;
    } else if (duration.value() < d->settings.minimumDetectionSeconds) {
        Logger::instance().info("Audio too short for language detection, using '{}'",
                                d->settings.defaultLanguage.toStdString());
        language = d->settings.defaultLanguage;
    } else {
        ProgressUpdate detecting;
        detecting.percentage = DetectionPercent;
        detecting.message = TranscriptionStateMachine::defaultMessage(TranscriptionState::DetectingLanguage, 0);
        if (!advance(TranscriptionState::DetectingLanguage, detecting)) {
            return;
        }
        language = segmenter.detectLanguage(request.audioPath, duration.value(), *speechModel);
        if (cancelIfRequested()) {
            return;
        }
    }

    ExecutionRequest execution;
    execution.audioPath = request.audioPath;
    execution.transcriptId = request.jobId;
    execution.durationSeconds = duration.value();
    execution.language = language;

    ChunkedTranscriptionExecutor executor(*d->decoder, *speechModel, d->settings);
    const int totalChunks = segmenter.chunkCount(duration.value());
    {
        QMutexLocker locker(&d->mutex);
        d->detectedLanguage = language;
        d->transcriptPath = executor.transcriptPath(request.jobId);
    }

    ProgressUpdate transcribing;
    transcribing.percentage = TranscriptionStartPercent;
    transcribing.totalChunks = totalChunks;
    transcribing.message = QString("Transcribing audio (%1)...").arg(language);
    if (!advance(TranscriptionState::Transcribing, transcribing)) {
        return;
    }

    QElapsedTimer chunkTimer;
    chunkTimer.start();
    auto onProgress = [this, &chunkTimer](const ChunkProgress& chunk) {
        const int span = TranscriptionEndPercent - TranscriptionStartPercent;
        ProgressUpdate update;
        update.currentChunk = chunk.currentChunk;
        update.totalChunks = chunk.totalChunks;
        update.message = chunk.message;
        update.percentage = chunk.totalChunks > 0
            ? TranscriptionStartPercent + span * chunk.completedChunks / chunk.totalChunks
            : TranscriptionStartPercent;
        if (chunk.completedChunks > 0) {
            const qint64 perChunk = chunkTimer.elapsed() / chunk.completedChunks;
            update.estimatedTimeRemaining =
                static_cast<int>(perChunk * (chunk.totalChunks - chunk.completedChunks) / 1000);
        }
        if (d->machine.updateProgress(update).hasValue()) {
            publish();
        }
    };

    auto executed = executor.execute(execution, onProgress, d->cancelRequested);
    if (executed.hasError()) {
        failJob(executed.error(), QString());
        return;
    }
    if (executed.value().cancelled) {
        finishJob(TranscriptionState::Cancelled,
                  ProgressUpdate{d->machine.progressPercentage(),
                                 QString("Transcription cancelled after %1 of %2 chunks")
                                     .arg(executed.value().completedChunks)
                                     .arg(executed.value().totalChunks),
                                 executed.value().completedChunks, executed.value().totalChunks});
        return;
    }

    ProgressUpdate postProcessing;
    postProcessing.percentage = TranscriptionEndPercent;
    postProcessing.currentChunk = executed.value().totalChunks;
    postProcessing.totalChunks = executed.value().totalChunks;
    postProcessing.message = TranscriptionStateMachine::defaultMessage(TranscriptionState::PostProcessing, 0);
    if (!advance(TranscriptionState::PostProcessing, postProcessing)) {
        return;
    }

    if (!QFileInfo::exists(executed.value().transcriptPath)) {
        failJob(TranscriptionError::SinkUnavailable, QString());
        return;
    }

    QString message = TranscriptionStateMachine::defaultMessage(TranscriptionState::Completed, 100);
    if (executed.value().failedChunks > 0) {
        message += QString(" (%1 of %2 chunks failed)")
                       .arg(executed.value().failedChunks)
                       .arg(executed.value().totalChunks);
    }
    Logger::instance().info("Job {} finished in {}ms", request.jobId.toStdString(), jobTimer.elapsed());
    finishJob(TranscriptionState::Completed,
              ProgressUpdate{100, message, executed.value().totalChunks, executed.value().totalChunks});
}

Expected<QString, TranscriptionError> TranscriptionJobController::ensureModel(const TranscriptionRequest& request) {
    auto path = d->assets.localPath(request.modelId);
    if (path.hasError()) {
        Logger::instance().error("Unknown model '{}'", request.modelId.toStdString());
        return makeUnexpected(TranscriptionError::ModelNotFound);
    }

    if (d->assets.isUsable(request.modelId)) {
        return path.value();
    }

    if (!request.allowModelDownload) {
        Logger::instance().error("Model '{}' is not downloaded", request.modelId.toStdString());
        return makeUnexpected(TranscriptionError::ModelNotDownloaded);
    }

    auto downloaded = downloadModel(request.modelId);
    if (downloaded.hasError()) {
        return downloaded;
    }

    if (!d->assets.isUsable(request.modelId)) {
        Logger::instance().error("Downloaded model '{}' is not usable", request.modelId.toStdString());
        return makeUnexpected(TranscriptionError::DownloadFailed);
    }
    return downloaded;
}

Expected<QString, TranscriptionError> TranscriptionJobController::downloadModel(const QString& modelId) {
    auto created = d->assets.createDownloadWorker(modelId);
    if (created.hasError()) {
        return makeUnexpected(TranscriptionError::ModelNotFound);
    }
    std::unique_ptr<ModelDownloadWorker> worker = std::move(created).value();

    connect(worker.get(), &ModelDownloadWorker::progressUpdated, this,
            [this](const DownloadProgress& progress) {
                ProgressUpdate update;
                update.message = progress.percentage >= 0
                    ? QString("Downloading model... %1%").arg(progress.percentage)
                    : QString("Downloading model... %1 MB").arg(progress.bytesDownloaded / (1024 * 1024));
                if (d->machine.updateProgress(update).hasValue()) {
                    publish();
                }
                emit modelDownloadProgress(progress);
            }, Qt::DirectConnection);
    connect(worker.get(), &ModelDownloadWorker::downloadCompleted, this,
            [this](const QString& id, bool success, const QString& message) {
                emit modelDownloadCompleted(id, success, message);
            }, Qt::DirectConnection);

    {
        QMutexLocker locker(&d->mutex);
        d->activeDownload = worker.get();
        if (d->cancelRequested.load()) {
            worker->cancel();
        }
    }

    Logger::instance().info("Model '{}' missing, downloading", modelId.toStdString());
    auto result = worker->run();

    {
        QMutexLocker locker(&d->mutex);
        d->activeDownload = nullptr;
    }

    if (result.hasValue()) {
        return result.value();
    }

    switch (result.error()) {
        case DownloadError::Cancelled:
            return makeUnexpected(TranscriptionError::Cancelled);
        case DownloadError::IntegrityCheckFailed:
            return makeUnexpected(TranscriptionError::IntegrityCheckFailed);
        default:
            d->gateFailure = QString("%1: %2").arg(errorToString(TranscriptionError::DownloadFailed),
                                                   downloadErrorToString(result.error()));
            Logger::instance().error("Model download failed: {}", worker->lastMessage().toStdString());
            return makeUnexpected(TranscriptionError::DownloadFailed);
    }
}

bool TranscriptionJobController::advance(TranscriptionState state, const ProgressUpdate& update) {
    auto result = d->machine.transitionTo(state, update);
    if (result.hasError()) {
        failJob(result.error(), QString("Cannot enter %1").arg(stateToString(state)));
        return false;
    }
    publish();
    return true;
}

void TranscriptionJobController::publish() {
    emit jobEvent(currentEvent());
}

TranscriptionEvent TranscriptionJobController::currentEvent() const {
    const TranscriptionProgress progress = d->machine.progress();

    TranscriptionEvent event;
    event.state = progress.state;
    event.percentage = progress.percentage;
    event.currentChunk = progress.currentChunk;
    event.totalChunks = progress.totalChunks;
    event.message = progress.message.isEmpty()
        ? TranscriptionStateMachine::defaultMessage(progress.state, progress.percentage)
        : progress.message;

    QMutexLocker locker(&d->mutex);
    event.jobId = d->jobId;
    event.detectedLanguage = d->detectedLanguage;
    event.transcriptPath = d->transcriptPath;
    event.startedAt = d->startedAt;
    return event;
}

void TranscriptionJobController::failJob(TranscriptionError error, const QString& message) {
    {
        QMutexLocker locker(&d->mutex);
        d->lastError = error;
    }

    const QString text = message.isEmpty() ? errorToString(error) : message;
    Logger::instance().error("Job {} failed: {}", currentJobId().toStdString(), text.toStdString());

    const TranscriptionProgress progress = d->machine.progress();
    finishJob(TranscriptionState::Failed,
              ProgressUpdate{progress.percentage, text, progress.currentChunk, progress.totalChunks});
}

void TranscriptionJobController::finishJob(TranscriptionState terminal, const ProgressUpdate& update) {
    auto result = d->machine.transitionTo(terminal, update);
    if (result.hasError()) {
        Logger::instance().error("Cannot finish job in state {}", stateToString(d->machine.state()).toStdString());
    }

    const TranscriptionEvent event = currentEvent();
    d->running = false;
    emit jobEvent(event);
}

bool TranscriptionJobController::cancelIfRequested() {
    if (!d->cancelRequested.load()) {
        return false;
    }
    finishJob(TranscriptionState::Cancelled,
              ProgressUpdate{d->machine.progressPercentage(), "Transcription cancelled"});
    return true;
}

} // namespace VoiceScribe

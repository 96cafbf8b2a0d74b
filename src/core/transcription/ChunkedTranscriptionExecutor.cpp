#include "ChunkedTranscriptionExecutor.hpp"
#include "SpeechModel.hpp"
#include "TranscriptSink.hpp"
#include "../common/Logger.hpp"

#include <QElapsedTimer>

namespace VoiceScribe {

ChunkedTranscriptionExecutor::ChunkedTranscriptionExecutor(AudioDecoder& decoder,
                                                           SpeechModel& model,
                                                           const Config::TranscriptionSettings& settings)
    : segmenter_(decoder, settings)
    , model_(model)
    , settings_(settings) {
}

Expected<ExecutionResult, TranscriptionError> ChunkedTranscriptionExecutor::execute(
    const ExecutionRequest& request,
    const ChunkProgressCallback& onProgress,
    const std::atomic<bool>& cancelRequested) {

    if (request.durationSeconds <= 0.0) {
        return makeUnexpected(TranscriptionError::AudioUnreadable);
    }

    ExecutionResult result;
    result.transcriptPath = transcriptPath(request.transcriptId);

    TranscriptSink sink(result.transcriptPath);
    auto opened = sink.open();
    if (opened.hasError()) {
        return makeUnexpected(opened.error());
    }

    const std::vector<AudioChunkSpec> chunks = segmenter_.planChunks(request.durationSeconds);
    const QString hint = languageHint(request.language);
    result.totalChunks = static_cast<int>(chunks.size());

    Logger::instance().info("Transcribing {} in {} chunk(s), language '{}'",
                            request.audioPath.toStdString(), result.totalChunks,
                            hint.isEmpty() ? settings_.defaultLanguage.toStdString() : hint.toStdString());

    QElapsedTimer timer;
    timer.start();

    for (const AudioChunkSpec& chunk : chunks) {
        if (cancelRequested.load()) {
            Logger::instance().info("Transcription cancelled before chunk {}", chunk.index + 1);
            result.cancelled = true;
            break;
        }

        if (onProgress) {
            ChunkProgress progress;
            progress.currentChunk = chunk.index + 1;
            progress.totalChunks = result.totalChunks;
            progress.completedChunks = chunk.index;
            progress.message = QString("Transcribing chunk %1 of %2...").arg(chunk.index + 1).arg(result.totalChunks);
            onProgress(progress);
        }

        const bool isFinal = chunk.index == result.totalChunks - 1;
        auto text = transcribeChunk(request.audioPath, chunk, hint);

        QString output;
        if (text.hasValue()) {
            output = text.value();
        } else {
            Logger::instance().warn("Chunk {} of {} failed: {}", chunk.index + 1, result.totalChunks,
                                    text.error().toStdString());
            output = errorMarker(chunk.durationSeconds, text.error());
            ++result.failedChunks;
        }

        auto appended = sink.appendChunk(output, isFinal);
        if (appended.hasError()) {
            return makeUnexpected(appended.error());
        }
        ++result.completedChunks;
    }

    sink.close();
    Logger::instance().info("Transcribed {}/{} chunk(s) in {}ms ({} failed)",
                            result.completedChunks, result.totalChunks, timer.elapsed(), result.failedChunks);
    return result;
}

Expected<QString, QString> ChunkedTranscriptionExecutor::transcribeChunk(const QString& audioPath,
                                                                         const AudioChunkSpec& chunk,
                                                                         const QString& hint) {
    auto samples = segmenter_.extractChunk(audioPath, chunk);
    if (samples.hasError()) {
        return makeUnexpected(audioErrorToString(samples.error()));
    }

    auto text = model_.transcribe(samples.value(), hint);
    if (text.hasError()) {
        return makeUnexpected(speechModelErrorToString(text.error()));
    }
    return text.value().trimmed();
}

QString ChunkedTranscriptionExecutor::languageHint(const QString& language) const {
    const QString normalized = language.trimmed().toLower();
    if (normalized.isEmpty() || normalized == "auto" ||
        normalized.compare(settings_.defaultLanguage, Qt::CaseInsensitive) == 0) {
        return QString();
    }
    return normalized;
}

QString ChunkedTranscriptionExecutor::transcriptPath(const QString& transcriptId) const {
    return TranscriptSink::pathFor(settings_.transcriptsPath, transcriptId);
}

QString ChunkedTranscriptionExecutor::errorMarker(double lengthSeconds, const QString& reason) {
    return QString("[Error transcribing %1s chunk: %2]").arg(lengthSeconds, 0, 'f', 1).arg(reason);
}

} // namespace VoiceScribe

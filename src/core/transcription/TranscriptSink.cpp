#include "TranscriptSink.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>

namespace VoiceScribe {

TranscriptSink::TranscriptSink(const QString& filePath)
    : file_(filePath) {
}

TranscriptSink::~TranscriptSink() {
    close();
}

Expected<void, TranscriptionError> TranscriptSink::open() {
    const QString directory = QFileInfo(file_.fileName()).absolutePath();
    if (!QDir().mkpath(directory)) {
        Logger::instance().error("Cannot create transcript directory: {}", directory.toStdString());
        return makeUnexpected(TranscriptionError::SinkUnavailable);
    }

    if (!file_.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        Logger::instance().error("Cannot open transcript {}: {}",
                                 file_.fileName().toStdString(),
                                 file_.errorString().toStdString());
        return makeUnexpected(TranscriptionError::SinkUnavailable);
    }

    chunksWritten_ = 0;
    return {};
}

Expected<void, TranscriptionError> TranscriptSink::appendChunk(const QString& text, bool isFinal) {
    if (!file_.isOpen()) {
        return makeUnexpected(TranscriptionError::SinkUnavailable);
    }

    QByteArray data = text.toUtf8();
    if (!isFinal) {
        data.append("\n\n");
    }

    if (file_.write(data) != data.size() || !file_.flush()) {
        Logger::instance().error("Failed to write transcript chunk {}: {}",
                                 chunksWritten_ + 1, file_.errorString().toStdString());
        return makeUnexpected(TranscriptionError::SinkUnavailable);
    }

    ++chunksWritten_;
    return {};
}

void TranscriptSink::close() {
    if (file_.isOpen()) {
        file_.close();
    }
}

bool TranscriptSink::isOpen() const {
    return file_.isOpen();
}

QString TranscriptSink::pathFor(const QString& directory, const QString& transcriptId) {
    return QDir(directory).filePath(transcriptId + ".txt");
}

} // namespace VoiceScribe

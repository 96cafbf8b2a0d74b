#pragma once

#include <QtCore/QFile>
#include <QtCore/QString>

#include "TranscriptionTypes.hpp"
#include "../common/Expected.hpp"

namespace VoiceScribe {

/**
 * @brief Append-only UTF-8 transcript file
 *
 * Chunks are separated by a blank line. Every append is flushed before it
 * returns, so a failed job leaves a valid prefix on disk.
 */
class TranscriptSink {
public:
    explicit TranscriptSink(const QString& filePath);
    ~TranscriptSink();

    TranscriptSink(const TranscriptSink&) = delete;
    TranscriptSink& operator=(const TranscriptSink&) = delete;

    Expected<void, TranscriptionError> open();
    Expected<void, TranscriptionError> appendChunk(const QString& text, bool isFinal);
    void close();

    bool isOpen() const;
    int chunksWritten() const { return chunksWritten_; }
    QString filePath() const { return file_.fileName(); }

    static QString pathFor(const QString& directory, const QString& transcriptId);

private:
    QFile file_;
    int chunksWritten_ = 0;
};

} // namespace VoiceScribe

#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <atomic>
#include <memory>

#include "../common/Expected.hpp"

namespace VoiceScribe {

enum class DownloadError {
    InvalidUrl,
    NetworkError,
    HttpError,
    FileSystemError,
    IntegrityCheckFailed,
    Cancelled
};

QString downloadErrorToString(DownloadError error);

struct DownloadRequest {
    QString modelId;
    QUrl url;
    QString destinationPath;
    QString expectedSha256;
};

// percentage is -1 while the total size is unknown
struct DownloadProgress {
    QString modelId;
    int percentage = -1;
    qint64 bytesDownloaded = 0;
    qint64 totalBytes = 0;
    qint64 elapsedMs = 0;
};

/**
 * @brief Streams one model file to disk
 *
 * run() blocks the calling thread while it drives its own network event
 * loop, so it is meant to be called from a background task. cancel() may be
 * called from any thread. The destination file only survives a run() that
 * returns a value; every other outcome deletes it.
 */
class ModelDownloadWorker : public QObject {
    Q_OBJECT

public:
    static constexpr qint64 ChunkSize = 64 * 1024;

    explicit ModelDownloadWorker(const DownloadRequest& request, QObject* parent = nullptr);
    ~ModelDownloadWorker() override;

    /**
     * @brief Download, write and verify the asset
     * @return The destination path on success
     */
    Expected<QString, DownloadError> run();

    void cancel();
    bool isCancelled() const;

    void setProgressInterval(int intervalMs);

    const DownloadRequest& request() const;
    qint64 bytesDownloaded() const;
    qint64 totalBytes() const;
    int httpStatus() const;
    QString lastMessage() const;

    static Expected<QString, DownloadError> calculateSha256(const QString& filePath);

signals:
    void statusUpdated(const QString& modelId, const QString& status);
    void progressUpdated(const VoiceScribe::DownloadProgress& progress);
    void downloadCompleted(const QString& modelId, bool success, const QString& message);
    void downloadCancelled(const QString& modelId);

private:
    struct ModelDownloadWorkerPrivate;
    std::unique_ptr<ModelDownloadWorkerPrivate> d;

    void emitProgress(bool force);
    void removePartialFile();
    Expected<QString, DownloadError> fail(DownloadError error, const QString& message);
};

} // namespace VoiceScribe

Q_DECLARE_METATYPE(VoiceScribe::DownloadProgress)

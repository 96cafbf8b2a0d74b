#include "ModelDownloadWorker.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QCryptographicHash>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QMutex>
#include <QtCore/QTimer>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

namespace VoiceScribe {

QString downloadErrorToString(DownloadError error) {
    switch (error) {
        case DownloadError::InvalidUrl: return QStringLiteral("Invalid download URL");
        case DownloadError::NetworkError: return QStringLiteral("Network error");
        case DownloadError::HttpError: return QStringLiteral("Server returned an error status");
        case DownloadError::FileSystemError: return QStringLiteral("Could not write the model file");
        case DownloadError::IntegrityCheckFailed: return QStringLiteral("File integrity check failed");
        case DownloadError::Cancelled: return QStringLiteral("Download cancelled");
    }
    return QStringLiteral("Unknown download error");
}

struct ModelDownloadWorker::ModelDownloadWorkerPrivate {
    DownloadRequest request;
    std::atomic<bool> cancelled{false};

    std::atomic<qint64> bytesDownloaded{0};
    std::atomic<qint64> totalBytes{0};
    std::atomic<int> httpStatus{0};
    bool destinationOpened = false;

    QElapsedTimer elapsed;
    qint64 lastProgressMs = -1;
    int progressIntervalMs = 250;

    mutable QMutex messageMutex;
    QString lastMessage;
};

ModelDownloadWorker::ModelDownloadWorker(const DownloadRequest& request, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<ModelDownloadWorkerPrivate>()) {
    qRegisterMetaType<VoiceScribe::DownloadProgress>("VoiceScribe::DownloadProgress");
    d->request = request;
    d->request.expectedSha256 = request.expectedSha256.toLower();
}

ModelDownloadWorker::~ModelDownloadWorker() = default;

Expected<QString, DownloadError> ModelDownloadWorker::run() {
    const DownloadRequest& req = d->request;
    d->destinationOpened = false;

    const QString scheme = req.url.scheme();
    if (!req.url.isValid() || (scheme != "http" && scheme != "https" && scheme != "file")) {
        return fail(DownloadError::InvalidUrl,
                    QString("Download failed: Invalid URL '%1'").arg(req.url.toString()));
    }

    const QFileInfo destination(req.destinationPath);
    if (!QDir().mkpath(destination.absolutePath())) {
        return fail(DownloadError::FileSystemError,
                    QString("Download failed: Cannot create %1").arg(destination.absolutePath()));
    }

    QFile file(req.destinationPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return fail(DownloadError::FileSystemError,
                    QString("Download failed: %1").arg(file.errorString()));
    }
    d->destinationOpened = true;

    emit statusUpdated(req.modelId, "Connecting...");
    Logger::instance().info("Downloading model '{}' from {}",
                            req.modelId.toStdString(), req.url.toString().toStdString());

    QNetworkAccessManager manager;
    manager.setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);
    QNetworkRequest request(req.url);
    request.setRawHeader("User-Agent", "VoiceScribe/1.0");

    d->bytesDownloaded = 0;
    d->totalBytes = 0;
    d->httpStatus = 0;
    d->lastProgressMs = -1;
    d->elapsed.start();

    std::unique_ptr<QNetworkReply> reply(manager.get(request));

    bool writeFailed = false;
    bool statusRejected = false;
    bool downloading = false;

    auto readMetadata = [&]() {
        const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (status.isValid()) {
            d->httpStatus = status.toInt();
        }
        const QVariant length = reply->header(QNetworkRequest::ContentLengthHeader);
        d->totalBytes = length.isValid() ? qMax<qint64>(0, length.toLongLong()) : qint64(0);
    };

    auto drain = [&]() {
        if (writeFailed || statusRejected) {
            return;
        }
        readMetadata();
        if (d->httpStatus != 0 && (d->httpStatus < 200 || d->httpStatus >= 300)) {
            statusRejected = true;
            reply->abort();
            return;
        }
        if (!downloading) {
            downloading = true;
            if (d->totalBytes == 0) {
                Logger::instance().warn("Content-Length missing for model '{}'", req.modelId.toStdString());
            }
            emit statusUpdated(req.modelId, "Downloading...");
        }
        while (reply->bytesAvailable() > 0) {
            if (d->cancelled.load()) {
                reply->abort();
                return;
            }
            const QByteArray chunk = reply->read(ChunkSize);
            if (chunk.isEmpty()) {
                break;
            }
            if (file.write(chunk) != chunk.size()) {
                writeFailed = true;
                reply->abort();
                return;
            }
            d->bytesDownloaded.fetch_add(chunk.size());
            emitProgress(false);
        }
    };

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::readyRead, &loop, drain);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    // Cancellation must also land while the server is silent
    QTimer cancelPoll;
    cancelPoll.setInterval(50);
    QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&]() {
        if (d->cancelled.load() && reply->isRunning()) {
            reply->abort();
        }
    });
    cancelPoll.start();

    if (!reply->isFinished()) {
        loop.exec();
    }
    cancelPoll.stop();

    if (!d->cancelled.load()) {
        drain();
    }

    if (d->cancelled.load()) {
        file.close();
        removePartialFile();
        {
            QMutexLocker locker(&d->messageMutex);
            d->lastMessage = "Download cancelled";
        }
        Logger::instance().info("Download cancelled for model '{}'", req.modelId.toStdString());
        emit downloadCancelled(req.modelId);
        return makeUnexpected(DownloadError::Cancelled);
    }

    file.close();

    if (writeFailed) {
        return fail(DownloadError::FileSystemError,
                    QString("Download failed: %1").arg(file.errorString()));
    }

    readMetadata();
    if (statusRejected || (d->httpStatus != 0 && (d->httpStatus < 200 || d->httpStatus >= 300))) {
        const QString reason = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        return fail(DownloadError::HttpError,
                    QString("Download failed: HTTP %1 %2").arg(d->httpStatus.load()).arg(reason).trimmed());
    }

    if (reply->error() != QNetworkReply::NoError) {
        return fail(DownloadError::NetworkError,
                    QString("Download failed: %1").arg(reply->errorString()));
    }

    if (file.error() != QFileDevice::NoError) {
        return fail(DownloadError::FileSystemError,
                    QString("Download failed: %1").arg(file.errorString()));
    }

    emitProgress(true);
    emit statusUpdated(req.modelId, "Download complete, verifying...");

    const QString fileName = destination.fileName();
    QString message;
    if (!req.expectedSha256.isEmpty()) {
        emit statusUpdated(req.modelId, "Verifying file integrity...");
        auto actual = calculateSha256(req.destinationPath);
        if (actual.hasError() || actual.value().compare(req.expectedSha256, Qt::CaseInsensitive) != 0) {
            Logger::instance().error("SHA256 mismatch for model '{}': expected {}, got {}",
                                     req.modelId.toStdString(),
                                     req.expectedSha256.toStdString(),
                                     actual.valueOr(QString("<unreadable>")).toStdString());
            return fail(DownloadError::IntegrityCheckFailed,
                        "Download failed: File integrity check failed");
        }
        emit statusUpdated(req.modelId, "Verification successful");
        message = QString("Successfully downloaded and verified %1").arg(fileName);
    } else {
        message = QString("Successfully downloaded %1").arg(fileName);
    }

    {
        QMutexLocker locker(&d->messageMutex);
        d->lastMessage = message;
    }
    Logger::instance().info("Model '{}' downloaded: {} bytes in {} ms",
                            req.modelId.toStdString(), d->bytesDownloaded.load(), d->elapsed.elapsed());
    emit downloadCompleted(req.modelId, true, message);
    return req.destinationPath;
}

void ModelDownloadWorker::cancel() {
    d->cancelled.store(true);
}

bool ModelDownloadWorker::isCancelled() const {
    return d->cancelled.load();
}

void ModelDownloadWorker::setProgressInterval(int intervalMs) {
    d->progressIntervalMs = qMax(0, intervalMs);
}

const DownloadRequest& ModelDownloadWorker::request() const {
    return d->request;
}

qint64 ModelDownloadWorker::bytesDownloaded() const {
    return d->bytesDownloaded;
}

qint64 ModelDownloadWorker::totalBytes() const {
    return d->totalBytes;
}

int ModelDownloadWorker::httpStatus() const {
    return d->httpStatus;
}

QString ModelDownloadWorker::lastMessage() const {
    QMutexLocker locker(&d->messageMutex);
    return d->lastMessage;
}

Expected<QString, DownloadError> ModelDownloadWorker::calculateSha256(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return makeUnexpected(DownloadError::FileSystemError);
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    while (!file.atEnd()) {
        const QByteArray block = file.read(ChunkSize);
        if (block.isEmpty() && file.error() != QFileDevice::NoError) {
            return makeUnexpected(DownloadError::FileSystemError);
        }
        hash.addData(block);
    }

    return QString::fromLatin1(hash.result().toHex());
}

void ModelDownloadWorker::emitProgress(bool force) {
    const qint64 now = d->elapsed.elapsed();
    if (!force && d->lastProgressMs >= 0 && now - d->lastProgressMs < d->progressIntervalMs) {
        return;
    }
    d->lastProgressMs = now;

    DownloadProgress progress;
    progress.modelId = d->request.modelId;
    progress.bytesDownloaded = d->bytesDownloaded;
    progress.totalBytes = d->totalBytes;
    progress.elapsedMs = now;
    if (d->totalBytes > 0) {
        progress.percentage = static_cast<int>(qMin<qint64>(100, progress.bytesDownloaded * 100 / progress.totalBytes));
    }
    emit progressUpdated(progress);
}

void ModelDownloadWorker::removePartialFile() {
    if (!d->destinationOpened) {
        return;
    }
    if (QFile::exists(d->request.destinationPath) && !QFile::remove(d->request.destinationPath)) {
        Logger::instance().warn("Failed to remove partial download: {}",
                                d->request.destinationPath.toStdString());
    }
}

Expected<QString, DownloadError> ModelDownloadWorker::fail(DownloadError error, const QString& message) {
    removePartialFile();
    {
        QMutexLocker locker(&d->messageMutex);
        d->lastMessage = message;
    }
    Logger::instance().error("Model '{}': {}", d->request.modelId.toStdString(), message.toStdString());
    emit downloadCompleted(d->request.modelId, false, message);
    return makeUnexpected(error);
}

} // namespace VoiceScribe

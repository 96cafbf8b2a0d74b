#include "ModelAssetManager.hpp"
#include "ModelRegistry.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

namespace VoiceScribe {

ModelAssetManager::ModelAssetManager(const ModelRegistry& registry, const Config::ModelSettings& settings)
    : registry_(registry)
    , settings_(settings) {
    if (!QDir().mkpath(settings_.modelsPath)) {
        Logger::instance().warn("Failed to create models directory: {}", settings_.modelsPath.toStdString());
    }
}

QString ModelAssetManager::modelsDirectory() const {
    return settings_.modelsPath;
}

Expected<QString, ModelError> ModelAssetManager::localPath(const QString& modelId) const {
    auto descriptor = registry_.find(modelId);
    if (descriptor.hasError()) {
        return makeUnexpected(descriptor.error());
    }
    return QDir(settings_.modelsPath).filePath(descriptor.value().fileName);
}

bool ModelAssetManager::isUsable(const QString& modelId) const {
    auto path = localPath(modelId);
    if (path.hasError()) {
        return false;
    }
    const QFileInfo info(path.value());
    return info.exists() && info.isFile() && info.size() > MinimumUsableBytes;
}

Expected<ModelDownloadInfo, ModelError> ModelAssetManager::downloadInfo(const QString& modelId) const {
    auto descriptor = registry_.find(modelId);
    if (descriptor.hasError()) {
        return makeUnexpected(descriptor.error());
    }

    const ModelDescriptor& model = descriptor.value();
    ModelDownloadInfo info;
    info.modelId = model.id;
    info.downloadUrl = model.downloadUrl;
    info.destinationPath = QDir(settings_.modelsPath).filePath(model.fileName);
    info.expectedSha256 = model.expectedSha256;
    info.displayName = model.displayName;
    info.sizeBytes = model.expectedSizeBytes;
    return info;
}

bool ModelAssetManager::verifyIntegrity(const QString& modelId) const {
    auto info = downloadInfo(modelId);
    if (info.hasError()) {
        return false;
    }

    if (info.value().expectedSha256.isEmpty()) {
        return isUsable(modelId);
    }

    if (!QFileInfo::exists(info.value().destinationPath)) {
        return false;
    }

    auto actual = ModelDownloadWorker::calculateSha256(info.value().destinationPath);
    if (actual.hasError()) {
        Logger::instance().warn("Cannot read model file for verification: {}",
                                info.value().destinationPath.toStdString());
        return false;
    }

    const bool matches = actual.value().compare(info.value().expectedSha256, Qt::CaseInsensitive) == 0;
    if (!matches) {
        Logger::instance().warn("Model '{}' failed integrity check", modelId.toStdString());
    }
    return matches;
}

Expected<ModelAsset, ModelError> ModelAssetManager::asset(const QString& modelId, bool verify) const {
    auto descriptor = registry_.find(modelId);
    if (descriptor.hasError()) {
        return makeUnexpected(descriptor.error());
    }

    ModelAsset result;
    result.descriptor = descriptor.value();
    result.localPath = QDir(settings_.modelsPath).filePath(result.descriptor.fileName);
    result.isPresent = isUsable(modelId);
    result.isVerified = verify && result.isPresent && verifyIntegrity(modelId);
    return result;
}

QString ModelAssetManager::statusText(const QString& modelId) const {
    auto descriptor = registry_.find(modelId);
    if (descriptor.hasError()) {
        return "Unknown model";
    }
    if (isUsable(modelId)) {
        return "Downloaded";
    }
    const qint64 size = descriptor.value().expectedSizeBytes;
    return QString("Not downloaded (%1)").arg(size > 0 ? formatSize(size) : QString("Unknown size"));
}

QList<QPair<QString, QString>> ModelAssetManager::availableModels() const {
    QList<QPair<QString, QString>> models;
    for (const ModelDescriptor& descriptor : registry_.descriptors()) {
        QString label = descriptor.displayName;
        if (descriptor.expectedSizeBytes > 0) {
            label += QString(" (%1)").arg(formatSize(descriptor.expectedSizeBytes));
        }
        models.append(qMakePair(descriptor.id, label));
    }
    return models;
}

Expected<std::unique_ptr<ModelDownloadWorker>, ModelError> ModelAssetManager::createDownloadWorker(const QString& modelId) const {
    auto info = downloadInfo(modelId);
    if (info.hasError()) {
        return makeUnexpected(info.error());
    }

    DownloadRequest request;
    request.modelId = info.value().modelId;
    request.url = info.value().downloadUrl;
    request.destinationPath = info.value().destinationPath;
    request.expectedSha256 = info.value().expectedSha256;

    auto worker = std::make_unique<ModelDownloadWorker>(request);
    worker->setProgressInterval(settings_.progressIntervalMs);
    return worker;
}

Expected<void, ModelError> ModelAssetManager::removeModel(const QString& modelId) {
    auto path = localPath(modelId);
    if (path.hasError()) {
        return makeUnexpected(path.error());
    }
    if (!QFile::exists(path.value())) {
        return makeUnexpected(ModelError::NotDownloaded);
    }
    if (!QFile::remove(path.value())) {
        Logger::instance().error("Failed to remove model file: {}", path.value().toStdString());
        return makeUnexpected(ModelError::FileSystemError);
    }
    Logger::instance().info("Removed model '{}'", modelId.toStdString());
    return {};
}

QString ModelAssetManager::formatSize(qint64 bytes) {
    const double megabytes = static_cast<double>(bytes) / MinimumUsableBytes;
    if (megabytes >= 1024.0) {
        return QString("%1 GB").arg(megabytes / 1024.0, 0, 'f', 2);
    }
    return QString("%1 MB").arg(qRound(megabytes));
}

} // namespace VoiceScribe

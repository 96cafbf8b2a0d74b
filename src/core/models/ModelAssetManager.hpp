#pragma once

#include <QtCore/QList>
#include <QtCore/QPair>
#include <QtCore/QString>
#include <memory>

#include "ModelDescriptor.hpp"
#include "ModelDownloadWorker.hpp"
#include "../common/Config.hpp"
#include "../common/Expected.hpp"

namespace VoiceScribe {

class ModelRegistry;

/**
 * @brief Answers whether a model can be used from local disk
 *
 * Every query reads the file system again; nothing about a model file is
 * cached because downloads and users may change it out of band.
 */
class ModelAssetManager {
public:
    // Files at or below this size are treated as truncated downloads
    static constexpr qint64 MinimumUsableBytes = 1024 * 1024;

    ModelAssetManager(const ModelRegistry& registry, const Config::ModelSettings& settings);

    QString modelsDirectory() const;
    Expected<QString, ModelError> localPath(const QString& modelId) const;

    bool isUsable(const QString& modelId) const;
    Expected<ModelDownloadInfo, ModelError> downloadInfo(const QString& modelId) const;

    /**
     * @brief Recompute the SHA-256 of the local file
     *
     * Falls back to isUsable() when the catalog has no checksum for the model.
     */
    bool verifyIntegrity(const QString& modelId) const;

    Expected<ModelAsset, ModelError> asset(const QString& modelId, bool verify = false) const;
    QString statusText(const QString& modelId) const;
    QList<QPair<QString, QString>> availableModels() const;

    Expected<std::unique_ptr<ModelDownloadWorker>, ModelError> createDownloadWorker(const QString& modelId) const;
    Expected<void, ModelError> removeModel(const QString& modelId);

private:
    static QString formatSize(qint64 bytes);

    const ModelRegistry& registry_;
    Config::ModelSettings settings_;
};

} // namespace VoiceScribe

#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QUrl>

namespace VoiceScribe {

enum class ModelError {
    UnknownModel,
    NotDownloaded,
    InvalidCatalog,
    FileSystemError
};

inline QString modelErrorToString(ModelError error) {
    switch (error) {
        case ModelError::UnknownModel: return QStringLiteral("Unknown model");
        case ModelError::NotDownloaded: return QStringLiteral("Model is not downloaded");
        case ModelError::InvalidCatalog: return QStringLiteral("Invalid model catalog");
        case ModelError::FileSystemError: return QStringLiteral("Model file could not be accessed");
    }
    return QStringLiteral("Unknown model error");
}

/**
 * @brief Catalog entry for one downloadable speech model
 *
 * Immutable once published by the registry. An empty expectedSha256 means
 * no checksum is on record for the model.
 */
struct ModelDescriptor {
    QString id;
    QString displayName;
    QString fileName;
    QUrl downloadUrl;
    qint64 expectedSizeBytes = 0;
    QString expectedSha256;
    QString description;

    bool hasChecksum() const { return !expectedSha256.isEmpty(); }
};

// Everything a download worker needs for one model
struct ModelDownloadInfo {
    QString modelId;
    QUrl downloadUrl;
    QString destinationPath;
    QString expectedSha256;
    QString displayName;
    qint64 sizeBytes = 0;
};

// Derived from disk state on every query, never cached
struct ModelAsset {
    ModelDescriptor descriptor;
    QString localPath;
    bool isPresent = false;
    bool isVerified = false;
};

} // namespace VoiceScribe

Q_DECLARE_METATYPE(VoiceScribe::ModelDescriptor)

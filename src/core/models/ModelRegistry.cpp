#include "ModelRegistry.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QSet>

namespace VoiceScribe {

namespace {

constexpr qint64 kMegabyte = 1024 * 1024;

QString firstString(const QJsonObject& object, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const QJsonValue value = object.value(QLatin1String(key));
        if (value.isString()) {
            return value.toString().trimmed();
        }
    }
    return QString();
}

} // namespace

ModelRegistry::ModelRegistry()
    : catalog_(builtinCatalog()) {
}

bool ModelRegistry::loadFromFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        useBuiltinCatalog(QString("cannot open %1").arg(path));
        return false;
    }
    Logger::instance().info("Loading model catalog from {}", path.toStdString());
    return loadFromJson(file.readAll());
}

bool ModelRegistry::loadFromJson(const QByteArray& json) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        useBuiltinCatalog(QString("parse error: %1").arg(parseError.errorString()));
        return false;
    }

    const QJsonObject root = doc.object();
    std::vector<ModelDescriptor> parsed;
    QSet<QString> seen;

    auto accept = [&](const QString& id, const QJsonObject& entry) {
        auto descriptor = parseDescriptor(id, entry);
        if (descriptor.hasError()) {
            Logger::instance().warn("Skipping catalog entry '{}': {}",
                                    id.toStdString(), descriptor.error().toStdString());
            return;
        }
        if (seen.contains(descriptor.value().id)) {
            Logger::instance().warn("Skipping duplicate catalog entry '{}'", id.toStdString());
            return;
        }
        seen.insert(descriptor.value().id);
        parsed.push_back(descriptor.value());
    };

    if (root.value("whisper_models").isObject()) {
        const QJsonObject models = root.value("whisper_models").toObject();
        for (auto it = models.constBegin(); it != models.constEnd(); ++it) {
            accept(it.key(), it.value().toObject());
        }
    } else if (root.value("models").isArray()) {
        const QJsonArray models = root.value("models").toArray();
        for (const QJsonValue& value : models) {
            const QJsonObject entry = value.toObject();
            accept(entry.value("id").toString(), entry);
        }
    } else {
        useBuiltinCatalog("no 'whisper_models' object or 'models' array");
        return false;
    }

    if (parsed.empty()) {
        useBuiltinCatalog("no valid entries");
        return false;
    }

    {
        QMutexLocker locker(&mutex_);
        catalog_ = std::move(parsed);
        builtin_ = false;
    }
    Logger::instance().info("Loaded {} model descriptors", size());
    return true;
}

Expected<void, ModelError> ModelRegistry::replaceCatalog(const std::vector<ModelDescriptor>& descriptors) {
    if (descriptors.empty()) {
        return makeUnexpected(ModelError::InvalidCatalog);
    }

    QSet<QString> seen;
    std::vector<ModelDescriptor> normalized;
    normalized.reserve(descriptors.size());
    for (ModelDescriptor descriptor : descriptors) {
        descriptor.expectedSha256 = descriptor.expectedSha256.toLower();
        if (descriptor.fileName.isEmpty()) {
            descriptor.fileName = defaultFileName(descriptor.id);
        }
        auto valid = validateDescriptor(descriptor);
        if (valid.hasError() || seen.contains(descriptor.id)) {
            Logger::instance().warn("Rejecting catalog update: entry '{}' is invalid",
                                    descriptor.id.toStdString());
            return makeUnexpected(ModelError::InvalidCatalog);
        }
        seen.insert(descriptor.id);
        normalized.push_back(descriptor);
    }

    QMutexLocker locker(&mutex_);
    catalog_ = std::move(normalized);
    builtin_ = false;
    return {};
}

Expected<ModelDescriptor, ModelError> ModelRegistry::find(const QString& modelId) const {
    QMutexLocker locker(&mutex_);
    for (const ModelDescriptor& descriptor : catalog_) {
        if (descriptor.id == modelId) {
            return descriptor;
        }
    }
    return makeUnexpected(ModelError::UnknownModel);
}

bool ModelRegistry::contains(const QString& modelId) const {
    return find(modelId).hasValue();
}

std::vector<ModelDescriptor> ModelRegistry::descriptors() const {
    QMutexLocker locker(&mutex_);
    return catalog_;
}

QStringList ModelRegistry::modelIds() const {
    QMutexLocker locker(&mutex_);
    QStringList ids;
    for (const ModelDescriptor& descriptor : catalog_) {
        ids << descriptor.id;
    }
    return ids;
}

int ModelRegistry::size() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(catalog_.size());
}

bool ModelRegistry::isUsingBuiltinCatalog() const {
    QMutexLocker locker(&mutex_);
    return builtin_;
}

std::vector<ModelDescriptor> ModelRegistry::builtinCatalog() {
    const QString base = QStringLiteral("https://huggingface.co/ggerganov/whisper.cpp/resolve/main/");

    ModelDescriptor tiny;
    tiny.id = "tiny";
    tiny.displayName = "Tiny";
    tiny.fileName = defaultFileName(tiny.id);
    tiny.downloadUrl = QUrl(base + tiny.fileName);
    tiny.expectedSizeBytes = 75 * kMegabyte;
    tiny.description = "Fastest, least accurate";

    ModelDescriptor baseModel;
    baseModel.id = "base";
    baseModel.displayName = "Base";
    baseModel.fileName = defaultFileName(baseModel.id);
    baseModel.downloadUrl = QUrl(base + baseModel.fileName);
    baseModel.expectedSizeBytes = 142 * kMegabyte;
    baseModel.description = "Good balance of speed and accuracy";

    return {tiny, baseModel};
}

bool ModelRegistry::isValidSha256(const QString& checksum) {
    if (checksum.size() != 64) {
        return false;
    }
    for (const QChar c : checksum) {
        const bool digit = c >= QLatin1Char('0') && c <= QLatin1Char('9');
        const bool lowerHex = c >= QLatin1Char('a') && c <= QLatin1Char('f');
        if (!digit && !lowerHex) {
            return false;
        }
    }
    return true;
}

QString ModelRegistry::defaultFileName(const QString& modelId) {
    return QString("ggml-%1.bin").arg(modelId);
}

Expected<ModelDescriptor, QString> ModelRegistry::parseDescriptor(const QString& id, const QJsonObject& object) {
    if (object.isEmpty()) {
        return makeUnexpected(QString("entry is not an object"));
    }

    ModelDescriptor descriptor;
    descriptor.id = id.trimmed();
    descriptor.displayName = firstString(object, {"display_name"});
    if (descriptor.displayName.isEmpty()) {
        descriptor.displayName = descriptor.id;
    }
    descriptor.fileName = firstString(object, {"file_name", "filename"});
    if (descriptor.fileName.isEmpty()) {
        descriptor.fileName = defaultFileName(descriptor.id);
    }
    descriptor.downloadUrl = QUrl(firstString(object, {"download_url"}));
    descriptor.expectedSha256 = firstString(object, {"expected_sha256", "sha256"}).toLower();
    descriptor.description = firstString(object, {"description"});

    if (object.value("expected_size_bytes").isDouble()) {
        descriptor.expectedSizeBytes = static_cast<qint64>(object.value("expected_size_bytes").toDouble());
    } else if (object.value("size_bytes").isDouble()) {
        descriptor.expectedSizeBytes = static_cast<qint64>(object.value("size_bytes").toDouble());
    } else if (object.value("size_mb").isDouble()) {
        descriptor.expectedSizeBytes = static_cast<qint64>(object.value("size_mb").toDouble() * kMegabyte);
    }

    auto valid = validateDescriptor(descriptor);
    if (valid.hasError()) {
        return makeUnexpected(valid.error());
    }
    return descriptor;
}

Expected<void, QString> ModelRegistry::validateDescriptor(const ModelDescriptor& descriptor) {
    if (descriptor.id.isEmpty()) {
        return makeUnexpected(QString("missing id"));
    }
    if (descriptor.fileName.contains('/') || descriptor.fileName.contains('\\')
        || descriptor.fileName == "." || descriptor.fileName == "..") {
        return makeUnexpected(QString("file name must not contain a path"));
    }
    const QString scheme = descriptor.downloadUrl.scheme();
    if (!descriptor.downloadUrl.isValid()
        || (scheme != "https" && scheme != "http" && scheme != "file")) {
        return makeUnexpected(QString("invalid download_url"));
    }
    if (descriptor.expectedSizeBytes < 0) {
        return makeUnexpected(QString("negative size"));
    }
    if (!descriptor.expectedSha256.isEmpty() && !isValidSha256(descriptor.expectedSha256)) {
        return makeUnexpected(QString("sha256 must be 64 lowercase hex characters"));
    }
    return {};
}

void ModelRegistry::useBuiltinCatalog(const QString& reason) {
    Logger::instance().warn("Model catalog unusable ({}), using built-in catalog", reason.toStdString());
    QMutexLocker locker(&mutex_);
    catalog_ = builtinCatalog();
    builtin_ = true;
}

} // namespace VoiceScribe

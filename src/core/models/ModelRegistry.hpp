#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <vector>

#include "ModelDescriptor.hpp"
#include "../common/Expected.hpp"

namespace VoiceScribe {

/**
 * @brief Catalog of known speech models
 *
 * Descriptors are loaded once from a JSON document and handed out by value.
 * A catalog update replaces the whole list; a document that cannot be used
 * leaves the built-in catalog in place so the registry is never empty.
 */
class ModelRegistry {
public:
    ModelRegistry();

    /**
     * @brief Load the catalog from a JSON file
     * @return true if the file supplied the catalog, false if the built-in
     *         catalog is in use
     */
    bool loadFromFile(const QString& path);
    bool loadFromJson(const QByteArray& json);

    Expected<void, ModelError> replaceCatalog(const std::vector<ModelDescriptor>& descriptors);

    Expected<ModelDescriptor, ModelError> find(const QString& modelId) const;
    bool contains(const QString& modelId) const;
    std::vector<ModelDescriptor> descriptors() const;
    QStringList modelIds() const;
    int size() const;
    bool isUsingBuiltinCatalog() const;

    static std::vector<ModelDescriptor> builtinCatalog();
    static bool isValidSha256(const QString& checksum);
    static QString defaultFileName(const QString& modelId);

private:
    static Expected<ModelDescriptor, QString> parseDescriptor(const QString& id, const QJsonObject& object);
    static Expected<void, QString> validateDescriptor(const ModelDescriptor& descriptor);
    void useBuiltinCatalog(const QString& reason);

    mutable QMutex mutex_;
    std::vector<ModelDescriptor> catalog_;
    bool builtin_ = true;
};

} // namespace VoiceScribe

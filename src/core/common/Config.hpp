#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace VoiceScribe {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "VoiceScribe",
                    const QString& applicationName = "VoiceScribe");

    // General settings
    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    // Typed convenience methods
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    double getDouble(const QString& key, double defaultValue = 0.0) const;

    // Handed to the model components at construction
    struct ModelSettings {
        QString modelsPath;
        QString catalogPath;
        QString selectedModel = "tiny";
        int progressIntervalMs = 250;
    };

    // Handed to the segmenter, executor and job controller at construction
    struct TranscriptionSettings {
        QString transcriptsPath;
        QString defaultLanguage = "en";
        double chunkSeconds = 600.0;
        double detectionWindowSeconds = 120.0;
        double minimumDetectionSeconds = 1.0;
        int threads = 4;
    };

    ModelSettings getModelSettings() const;
    TranscriptionSettings getTranscriptionSettings() const;

    void setModelSettings(const ModelSettings& settings);
    void setTranscriptionSettings(const TranscriptionSettings& settings);

    QString getSelectedModel() const;
    void setSelectedModel(const QString& modelId);

    QString getLogLevel() const;

    // Paths
    QString getDataPath() const;
    QString getLogFilePath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
    // Falls back to defaultValue for zero, negative or NaN values
    double positiveSeconds(const QString& key, double defaultValue) const;
};

} // namespace VoiceScribe

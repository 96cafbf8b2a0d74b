#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QStringList>
#include <QtCore/QThread>

namespace VoiceScribe {

namespace {
const QString kSelectedModelKey = QStringLiteral("transcription/selected_model");
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    VOICESCRIBE_INFO("Config initialized for {}/{}",
                     organizationName.toStdString(), applicationName.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

double Config::positiveSeconds(const QString& key, double defaultValue) const {
    const double value = getDouble(key, defaultValue);
    if (!(value > 0.0)) {
        VOICESCRIBE_WARN("Ignoring non-positive {} = {}, using {}", key.toStdString(), value, defaultValue);
        return defaultValue;
    }
    return value;
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

double Config::getDouble(const QString& key, double defaultValue) const {
    return getValue(key, defaultValue).toDouble();
}

Config::ModelSettings Config::getModelSettings() const {
    ModelSettings settings;
    settings.modelsPath = getString("models/path", getDataPath() + "/models");

    QString bundledCatalog;
    if (QCoreApplication::instance()) {
        bundledCatalog = QCoreApplication::applicationDirPath() + "/whisper_models.json";
    }
    settings.catalogPath = getString("models/catalogPath", bundledCatalog);
    settings.selectedModel = getSelectedModel();
    settings.progressIntervalMs = getInt("models/progressIntervalMs", 250);
    return settings;
}

Config::TranscriptionSettings Config::getTranscriptionSettings() const {
    TranscriptionSettings settings;
    settings.transcriptsPath = getString("transcription/transcriptsPath",
        getDataPath() + "/transcriptions");
    settings.defaultLanguage = getString("transcription/defaultLanguage", "en");
    settings.chunkSeconds = positiveSeconds("transcription/chunkSeconds", 600.0);
    settings.detectionWindowSeconds = positiveSeconds("transcription/detectionWindowSeconds", 120.0);
    settings.minimumDetectionSeconds = getDouble("transcription/minimumDetectionSeconds", 1.0);
    settings.threads = getInt("transcription/threads", qBound(1, QThread::idealThreadCount(), 8));
    return settings;
}

void Config::setModelSettings(const ModelSettings& settings) {
    setValue("models/path", settings.modelsPath);
    setValue("models/catalogPath", settings.catalogPath);
    setValue("models/progressIntervalMs", settings.progressIntervalMs);
    setSelectedModel(settings.selectedModel);
}

void Config::setTranscriptionSettings(const TranscriptionSettings& settings) {
    setValue("transcription/transcriptsPath", settings.transcriptsPath);
    setValue("transcription/defaultLanguage", settings.defaultLanguage);
    setValue("transcription/chunkSeconds", settings.chunkSeconds);
    setValue("transcription/detectionWindowSeconds", settings.detectionWindowSeconds);
    setValue("transcription/minimumDetectionSeconds", settings.minimumDetectionSeconds);
    setValue("transcription/threads", settings.threads);
}

QString Config::getSelectedModel() const {
    return getString(kSelectedModelKey, "tiny");
}

void Config::setSelectedModel(const QString& modelId) {
    setValue(kSelectedModelKey, modelId);
}

QString Config::getLogLevel() const {
    return getString("logging/level", "info");
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getLogFilePath() const {
    return getDataPath() + "/voicescribe.log";
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    QStringList paths = {
        getDataPath(),
        getModelSettings().modelsPath,
        getTranscriptionSettings().transcriptsPath
    };

    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            VOICESCRIBE_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace VoiceScribe

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <fmt/core.h>
#include <cstdio>
#include <memory>

#include "core/audio/FFmpegAudioDecoder.hpp"
#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/models/ModelAssetManager.hpp"
#include "core/models/ModelDownloadWorker.hpp"
#include "core/models/ModelRegistry.hpp"
#include "core/transcription/TranscriptionJobController.hpp"

namespace {

using namespace VoiceScribe;

void printDownloadProgress(const DownloadProgress& progress) {
    if (progress.percentage >= 0) {
        fmt::print("\r{}: {}% ({} / {} bytes)", progress.modelId.toStdString(),
                   progress.percentage, progress.bytesDownloaded, progress.totalBytes);
    } else {
        fmt::print("\r{}: {} bytes", progress.modelId.toStdString(), progress.bytesDownloaded);
    }
    std::fflush(stdout);
}

int listModels(const ModelAssetManager& assets, const QString& selectedModel) {
    for (const auto& entry : assets.availableModels()) {
        fmt::print("{} {:<12} {:<28} {}\n",
                   entry.first == selectedModel ? '*' : ' ',
                   entry.first.toStdString(),
                   entry.second.toStdString(),
                   assets.statusText(entry.first).toStdString());
    }
    return 0;
}

int downloadModel(const ModelAssetManager& assets, const QString& modelId) {
    auto worker = assets.createDownloadWorker(modelId);
    if (worker.hasError()) {
        fmt::print(stderr, "{}: {}\n", modelId.toStdString(), modelErrorToString(worker.error()).toStdString());
        return 1;
    }

    QObject::connect(worker.value().get(), &ModelDownloadWorker::progressUpdated, &printDownloadProgress);
    QObject::connect(worker.value().get(), &ModelDownloadWorker::statusUpdated,
                     [](const QString& id, const QString& status) {
                         fmt::print("\n{}: {}\n", id.toStdString(), status.toStdString());
                     });

    auto result = worker.value()->run();
    fmt::print("\n{}\n", worker.value()->lastMessage().toStdString());
    return result.hasValue() ? 0 : 1;
}

int verifyModel(const ModelAssetManager& assets, const QString& modelId) {
    auto asset = assets.asset(modelId, true);
    if (asset.hasError()) {
        fmt::print(stderr, "{}: {}\n", modelId.toStdString(), modelErrorToString(asset.error()).toStdString());
        return 1;
    }
    if (!asset.value().isPresent) {
        fmt::print("{}: not downloaded\n", modelId.toStdString());
        return 1;
    }
    const bool hasChecksum = asset.value().descriptor.hasChecksum();
    fmt::print("{}: {}\n", modelId.toStdString(),
               asset.value().isVerified ? (hasChecksum ? "checksum verified" : "present (no checksum on record)")
                                        : "integrity check failed");
    return asset.value().isVerified ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("VoiceScribe");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("VoiceScribe");

    QCommandLineParser parser;
    parser.setApplicationDescription("Transcribe long audio recordings with local speech models");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("audio", "Audio file to transcribe");

    const QCommandLineOption listOption("list-models", "List catalog models and their status");
    const QCommandLineOption downloadOption("download", "Download a model", "id");
    const QCommandLineOption verifyOption("verify", "Verify a downloaded model", "id");
    const QCommandLineOption selectOption("select", "Remember a model as the default", "id");
    const QCommandLineOption modelOption("model", "Model used for transcription", "id");
    const QCommandLineOption idOption("id", "Job id, also the transcript file name", "id");
    const QCommandLineOption languageOption("language", "Language code, or auto", "code", "auto");
    const QCommandLineOption noDownloadOption("no-download", "Fail instead of downloading a missing model");
    const QCommandLineOption catalogOption("catalog", "Model catalog JSON file", "path");
    const QCommandLineOption modelsDirOption("models-dir", "Directory holding model files", "path");
    const QCommandLineOption transcriptsDirOption("transcripts-dir", "Directory for transcripts", "path");
    const QCommandLineOption logLevelOption("log-level", "trace, debug, info, warn, error", "level");

    parser.addOptions({listOption, downloadOption, verifyOption, selectOption, modelOption, idOption,
                       languageOption, noDownloadOption, catalogOption, modelsDirOption,
                       transcriptsDirOption, logLevelOption});
    parser.process(app);

    Config& config = Config::instance();
    config.initialize();

    const QString levelName = parser.isSet(logLevelOption) ? parser.value(logLevelOption) : config.getLogLevel();
    Logger::instance().initialize(config.getLogFilePath().toStdString(),
                                  Logger::levelFromString(levelName, Logger::Level::Warn));
    Logger::instance().info("Starting VoiceScribe v{}", app.applicationVersion().toStdString());

    Config::ModelSettings modelSettings = config.getModelSettings();
    if (parser.isSet(modelsDirOption)) {
        modelSettings.modelsPath = QDir(parser.value(modelsDirOption)).absolutePath();
    }
    if (parser.isSet(catalogOption)) {
        modelSettings.catalogPath = parser.value(catalogOption);
    }

    Config::TranscriptionSettings transcriptionSettings = config.getTranscriptionSettings();
    if (parser.isSet(transcriptsDirOption)) {
        transcriptionSettings.transcriptsPath = QDir(parser.value(transcriptsDirOption)).absolutePath();
    }

    ModelRegistry registry;
    if (!modelSettings.catalogPath.isEmpty()) {
        registry.loadFromFile(modelSettings.catalogPath);
    }
    ModelAssetManager assets(registry, modelSettings);

    if (parser.isSet(selectOption)) {
        const QString modelId = parser.value(selectOption);
        if (!registry.contains(modelId)) {
            fmt::print(stderr, "Unknown model: {}\n", modelId.toStdString());
            return 1;
        }
        config.setSelectedModel(modelId);
        config.sync();
        fmt::print("Selected model: {}\n", modelId.toStdString());
        return 0;
    }
    if (parser.isSet(listOption)) {
        return listModels(assets, config.getSelectedModel());
    }
    if (parser.isSet(downloadOption)) {
        return downloadModel(assets, parser.value(downloadOption));
    }
    if (parser.isSet(verifyOption)) {
        return verifyModel(assets, parser.value(verifyOption));
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(1);
    }

    TranscriptionRequest request;
    request.audioPath = QFileInfo(positional.first()).absoluteFilePath();
    request.modelId = parser.isSet(modelOption) ? parser.value(modelOption) : config.getSelectedModel();
    request.jobId = parser.value(idOption);
    request.language = parser.value(languageOption);
    request.allowModelDownload = !parser.isSet(noDownloadOption);

    TranscriptionJobController controller(assets,
                                          std::make_shared<FFmpegAudioDecoder>(),
                                          TranscriptionJobController::whisperModelFactory(transcriptionSettings.threads),
                                          transcriptionSettings);

    QObject::connect(&controller, &TranscriptionJobController::modelDownloadProgress, &app, &printDownloadProgress);
    QObject::connect(&controller, &TranscriptionJobController::jobEvent, &app,
                     [&app](const TranscriptionEvent& event) {
                         fmt::print("[{:>3}%] {}: {}\n", event.percentage,
                                    stateToString(event.state).toStdString(), event.message.toStdString());
                         if (!event.isTerminal()) {
                             return;
                         }
                         if (!event.transcriptPath.isEmpty()) {
                             fmt::print("Transcript: {}\n", event.transcriptPath.toStdString());
                         }
                         app.exit(event.state == TranscriptionState::Completed ? 0 : 1);
                     });

    auto started = controller.startJob(request);
    if (started.hasError()) {
        fmt::print(stderr, "{}\n", errorToString(started.error()).toStdString());
        return 1;
    }

    const int result = app.exec();
    controller.waitForIdle();
    config.sync();
    Logger::instance().info("VoiceScribe finished with code {}", result);
    return result;
}

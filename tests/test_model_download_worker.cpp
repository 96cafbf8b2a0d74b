#include <QtTest/QtTest>
#include <QtCore/QFile>
#include <QtTest/QSignalSpy>

#include "../src/core/models/ModelDownloadWorker.hpp"
#include "utils/TestUtils.hpp"

using namespace VoiceScribe;
using namespace VoiceScribe::Test;

class TestModelDownloadWorker : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testFileUrlDownloadWithChecksum();
    void testChecksumMismatchRemovesFile();
    void testHttpDownloadReportsProgress();
    void testUnknownSizeReportsIndeterminateProgress();
    void testCancelDuringDownload();
    void testHttpErrorStatus();
    void testConnectionRefused();
    void testInvalidUrlLeavesExistingFile();
    void testCalculateSha256();

private:
    DownloadRequest request(const QUrl& url, const QString& sha = QString()) const;

    QString tempDir_;
    QString destination_;
};

DownloadRequest TestModelDownloadWorker::request(const QUrl& url, const QString& sha) const {
    DownloadRequest req;
    req.modelId = "tiny";
    req.url = url;
    req.destinationPath = destination_;
    req.expectedSha256 = sha;
    return req;
}

void TestModelDownloadWorker::init() {
    tempDir_ = TestUtils::createTempDirectory("download");
    destination_ = tempDir_ + "/models/ggml-tiny.bin";
}

void TestModelDownloadWorker::cleanup() {
    TestUtils::stopTestHttpServer();
    TestUtils::cleanupTempDirectory(tempDir_);
}

void TestModelDownloadWorker::testFileUrlDownloadWithChecksum() {
    const QString source = tempDir_ + "/source/model.bin";
    const QString sha = TestUtils::createModelFile(source, 300 * 1024);

    // Upper-case checksums from a catalog still match
    ModelDownloadWorker worker(request(QUrl::fromLocalFile(source), sha.toUpper()));
    QSignalSpy completed(&worker, &ModelDownloadWorker::downloadCompleted);

    auto result = worker.run();
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(result.value(), destination_);
    ASSERT_FILE_EXISTS(destination_);
    QCOMPARE(TestUtils::sha256Of(destination_), sha);
    QCOMPARE(worker.bytesDownloaded(), qint64(300 * 1024));

    QCOMPARE(completed.count(), 1);
    QCOMPARE(completed.at(0).at(1).toBool(), true);
    QVERIFY(completed.at(0).at(2).toString().contains("verified"));
}

void TestModelDownloadWorker::testChecksumMismatchRemovesFile() {
    const QString source = tempDir_ + "/source/model.bin";
    TestUtils::createModelFile(source, 128 * 1024);

    ModelDownloadWorker worker(request(QUrl::fromLocalFile(source), QString(64, QLatin1Char('0'))));
    QSignalSpy completed(&worker, &ModelDownloadWorker::downloadCompleted);

    ASSERT_EXPECTED_ERROR(worker.run(), DownloadError::IntegrityCheckFailed);
    ASSERT_FILE_NOT_EXISTS(destination_);
    QCOMPARE(completed.count(), 1);
    QCOMPARE(completed.at(0).at(1).toBool(), false);
    QCOMPARE(worker.lastMessage(), QString("Download failed: File integrity check failed"));
}

void TestModelDownloadWorker::testHttpDownloadReportsProgress() {
    TestHttpRoute route;
    route.body = TestUtils::generatePatternData(512 * 1024);
    route.chunkSize = 64 * 1024;
    route.chunkIntervalMs = 10;
    const QString base = TestUtils::startTestHttpServer({{"/ggml-tiny.bin", route}});
    QVERIFY(!base.isEmpty());

    ModelDownloadWorker worker(request(QUrl(base + "/ggml-tiny.bin")));
    worker.setProgressInterval(0);

    QList<DownloadProgress> updates;
    connect(&worker, &ModelDownloadWorker::progressUpdated, this,
            [&updates](const DownloadProgress& progress) { updates.append(progress); });

    auto result = worker.run();
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(worker.httpStatus(), 200);
    QCOMPARE(QFileInfo(destination_).size(), qint64(512 * 1024));

    QVERIFY(!updates.isEmpty());
    int previous = -1;
    for (const DownloadProgress& progress : updates) {
        QCOMPARE(progress.modelId, QString("tiny"));
        QCOMPARE(progress.totalBytes, qint64(512 * 1024));
        QVERIFY(progress.percentage >= previous);
        previous = progress.percentage;
    }
    QCOMPARE(updates.last().percentage, 100);
    QCOMPARE(updates.last().bytesDownloaded, qint64(512 * 1024));
}

void TestModelDownloadWorker::testUnknownSizeReportsIndeterminateProgress() {
    TestHttpRoute route;
    route.body = TestUtils::generatePatternData(200 * 1024);
    route.sendContentLength = false;
    route.chunkSize = 50 * 1024;
    route.chunkIntervalMs = 10;
    const QString base = TestUtils::startTestHttpServer({{"/ggml-tiny.bin", route}});

    ModelDownloadWorker worker(request(QUrl(base + "/ggml-tiny.bin")));
    worker.setProgressInterval(0);

    QList<DownloadProgress> updates;
    connect(&worker, &ModelDownloadWorker::progressUpdated, this,
            [&updates](const DownloadProgress& progress) { updates.append(progress); });

    ASSERT_EXPECTED_VALUE(worker.run());
    QCOMPARE(QFileInfo(destination_).size(), qint64(200 * 1024));

    QVERIFY(!updates.isEmpty());
    for (const DownloadProgress& progress : updates) {
        QCOMPARE(progress.percentage, -1);
        QCOMPARE(progress.totalBytes, qint64(0));
    }
    QCOMPARE(updates.last().bytesDownloaded, qint64(200 * 1024));
}

void TestModelDownloadWorker::testCancelDuringDownload() {
    TestHttpRoute route;
    route.body = TestUtils::generatePatternData(2 * 1024 * 1024);
    route.chunkSize = 32 * 1024;
    route.chunkIntervalMs = 20;
    const QString base = TestUtils::startTestHttpServer({{"/ggml-tiny.bin", route}});

    ModelDownloadWorker worker(request(QUrl(base + "/ggml-tiny.bin")));
    worker.setProgressInterval(0);
    QSignalSpy cancelled(&worker, &ModelDownloadWorker::downloadCancelled);
    QSignalSpy completed(&worker, &ModelDownloadWorker::downloadCompleted);

    connect(&worker, &ModelDownloadWorker::progressUpdated, this,
            [&worker](const DownloadProgress& progress) {
                if (progress.bytesDownloaded > 0) {
                    worker.cancel();
                }
            });

    ASSERT_EXPECTED_ERROR(worker.run(), DownloadError::Cancelled);
    QVERIFY(worker.isCancelled());
    QVERIFY(worker.bytesDownloaded() < 2 * 1024 * 1024);
    ASSERT_FILE_NOT_EXISTS(destination_);
    QCOMPARE(cancelled.count(), 1);
    QCOMPARE(cancelled.at(0).at(0).toString(), QString("tiny"));
    QCOMPARE(completed.count(), 0);
}

void TestModelDownloadWorker::testHttpErrorStatus() {
    const QString base = TestUtils::startTestHttpServer({});

    ModelDownloadWorker worker(request(QUrl(base + "/missing.bin")));
    QSignalSpy completed(&worker, &ModelDownloadWorker::downloadCompleted);

    ASSERT_EXPECTED_ERROR(worker.run(), DownloadError::HttpError);
    QCOMPARE(worker.httpStatus(), 404);
    QVERIFY(worker.lastMessage().startsWith("Download failed: HTTP 404"));
    QCOMPARE(downloadErrorToString(DownloadError::HttpError), QString("Server returned an error status"));
    ASSERT_FILE_NOT_EXISTS(destination_);
    QCOMPARE(completed.count(), 1);
    QCOMPARE(completed.at(0).at(1).toBool(), false);
}

void TestModelDownloadWorker::testConnectionRefused() {
    // Grab a free port, then close it again
    const QString base = TestUtils::startTestHttpServer({});
    TestUtils::stopTestHttpServer();
    QCoreApplication::processEvents();

    ModelDownloadWorker worker(request(QUrl(base + "/ggml-tiny.bin")));
    ASSERT_EXPECTED_ERROR(worker.run(), DownloadError::NetworkError);
    ASSERT_FILE_NOT_EXISTS(destination_);
}

void TestModelDownloadWorker::testInvalidUrlLeavesExistingFile() {
    TestUtils::createModelFile(destination_, 4096);

    ModelDownloadWorker worker(request(QUrl("ftp://example.com/ggml-tiny.bin")));
    ASSERT_EXPECTED_ERROR(worker.run(), DownloadError::InvalidUrl);
    ASSERT_FILE_EXISTS(destination_);

    ModelDownloadWorker empty(request(QUrl()));
    ASSERT_EXPECTED_ERROR(empty.run(), DownloadError::InvalidUrl);
    ASSERT_FILE_EXISTS(destination_);
}

void TestModelDownloadWorker::testCalculateSha256() {
    const QString path = TestUtils::createTestTextFile(tempDir_, "abc", "abc.txt");
    auto sha = ModelDownloadWorker::calculateSha256(path);
    ASSERT_EXPECTED_VALUE(sha);
    QCOMPARE(sha.value(), QString("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));

    ASSERT_EXPECTED_ERROR(ModelDownloadWorker::calculateSha256(tempDir_ + "/nothing"),
                          DownloadError::FileSystemError);
}

int runTestModelDownloadWorker(int argc, char** argv) {
    TestModelDownloadWorker test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_model_download_worker.moc"

#include <QtTest/QtTest>
#include <memory>
#include "../src/core/common/Expected.hpp"

using namespace VoiceScribe;

enum class SampleError {
    None,
    Broken
};

class TestExpected : public QObject {
    Q_OBJECT

private slots:
    void testValueConstruction() {
        Expected<int, QString> result(42);

        QVERIFY(result.hasValue());
        QVERIFY(!result.hasError());
        QCOMPARE(result.value(), 42);
    }

    void testErrorConstruction() {
        Expected<int, QString> result(QString("Error occurred"));

        QVERIFY(!result.hasValue());
        QVERIFY(result.hasError());
        QCOMPARE(result.error(), QString("Error occurred"));
    }

    void testUnexpectedWhenTypesOverlap() {
        Expected<QString, QString> success(QString("text"));
        Expected<QString, QString> failure(makeUnexpected(QString("reason")));

        QVERIFY(success.hasValue());
        QCOMPARE(success.value(), QString("text"));
        QVERIFY(failure.hasError());
        QCOMPARE(failure.error(), QString("reason"));
    }

    void testMonadicOperations() {
        Expected<int, QString> success(10);

        auto doubled = success.transform([](int x) { return x * 2; });
        QVERIFY(doubled.hasValue());
        QCOMPARE(doubled.value(), 20);

        Expected<int, QString> failure("Failed");
        auto failedTransform = failure.transform([](int x) { return x * 2; });
        QVERIFY(failedTransform.hasError());
        QCOMPARE(failedTransform.error(), QString("Failed"));
    }

    void testValueOr() {
        Expected<int, QString> success(42);
        QCOMPARE(success.valueOr(0), 42);

        Expected<int, QString> failure("Error");
        QCOMPARE(failure.valueOr(99), 99);
    }

    void testCopySemantics() {
        Expected<int, QString> original(123);
        Expected<int, QString> copy = original;

        QVERIFY(copy.hasValue());
        QCOMPARE(copy.value(), 123);

        QVERIFY(original.hasValue());
        QCOMPARE(original.value(), 123);
    }

    void testMoveOnlyValue() {
        Expected<std::unique_ptr<int>, SampleError> result(std::make_unique<int>(7));
        QVERIFY(result.hasValue());

        std::unique_ptr<int> owned = std::move(result).value();
        QVERIFY(owned);
        QCOMPARE(*owned, 7);
    }

    void testVoidSuccessAndError() {
        Expected<void, SampleError> success;
        QVERIFY(success.hasValue());
        QVERIFY(static_cast<bool>(success));

        Expected<void, SampleError> failure = makeUnexpected(SampleError::Broken);
        QVERIFY(failure.hasError());
        QVERIFY(failure.error() == SampleError::Broken);
    }

    void testAccessingWrongAlternativeThrows() {
        Expected<int, SampleError> failure = makeUnexpected(SampleError::Broken);
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, failure.value());

        Expected<int, SampleError> success(1);
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, success.error());
    }
};

int runTestExpected(int argc, char** argv) {
    TestExpected test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_expected.moc"

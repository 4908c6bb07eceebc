#include <QtTest/QtTest>
#include "../src/core/common/Errors.hpp"
#include "../src/core/common/Expected.hpp"

using namespace Episodic;

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
        Expected<int, QString> result = makeUnexpected(QString("Error occurred"));

        QVERIFY(!result.hasValue());
        QVERIFY(result.hasError());
        QCOMPARE(result.error(), QString("Error occurred"));
    }

    void testStructuredError() {
        Expected<qint64, TransferError> result = makeUnexpected(TransferError{
            TransferError::Kind::Unreachable, TransferError::UnreachableReason::UrlExpired, 403, "HTTP 403"});

        QVERIFY(result.hasError());
        QCOMPARE(result.error().kind, TransferError::Kind::Unreachable);
        QCOMPARE(result.error().reason, TransferError::UnreachableReason::UrlExpired);
        QCOMPARE(result.error().httpStatus, 403);
        QVERIFY(describe(result.error()).startsWith("Unreachable"));
    }

    void testVoidSpecialization() {
        Expected<void, StoreError> success;
        QVERIFY(success.hasValue());
        QVERIFY(static_cast<bool>(success));

        Expected<void, StoreError> failure = makeUnexpected(StoreError{StoreError::Kind::Corrupt, "bad json"});
        QVERIFY(failure.hasError());
        QCOMPARE(failure.error().kind, StoreError::Kind::Corrupt);
        QCOMPARE(failure.error().detail, QString("bad json"));

        Expected<void, StoreError> copy = failure;
        QVERIFY(copy.hasError());
        QCOMPARE(copy.error().detail, QString("bad json"));
    }

    void testMonadicOperations() {
        Expected<int, QString> success(10);

        auto doubled = success.transform([](int x) { return x * 2; });
        QVERIFY(doubled.hasValue());
        QCOMPARE(doubled.value(), 20);

        Expected<int, QString> failure = makeUnexpected(QString("Failed"));
        auto failedTransform = failure.transform([](int x) { return x * 2; });
        QVERIFY(failedTransform.hasError());
        QCOMPARE(failedTransform.error(), QString("Failed"));
    }

    void testValueOr() {
        Expected<int, QString> success(42);
        QCOMPARE(success.valueOr(0), 42);

        Expected<int, QString> failure = makeUnexpected(QString("Error"));
        QCOMPARE(failure.valueOr(99), 99);
    }

    void testAccessingWrongSideThrows() {
        Expected<int, QString> success(1);
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, success.error());

        Expected<int, QString> failure = makeUnexpected(QString("Error"));
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, failure.value());
    }

    void testCopySemantics() {
        Expected<int, QString> original(123);
        Expected<int, QString> copy = original;

        QVERIFY(copy.hasValue());
        QCOMPARE(copy.value(), 123);

        // Original should still be valid
        QVERIFY(original.hasValue());
        QCOMPARE(original.value(), 123);
    }
};

int runTestExpected(int argc, char** argv) {
    TestExpected test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_expected.moc"

#include <QtTest/QtTest>
#include <QJsonObject>
#include <QJsonValue>
#include "services/governance/service_message.h"

#include <cerrno>

class TestServiceMessage : public QObject {
    Q_OBJECT

private slots:
    // ── Framing ──────────────────────────────────────────────────
    void testEncodeIsSingleLine();
    void testDecodeRoundtrip();
    void testUnicodeContentSurvives();

    // ── Envelopes ────────────────────────────────────────────────
    void testMakeRequestOmitsEmptyParams();
    void testMakeResponseStructure();
    void testMakeErrorStructure();

    // ── Decode edge cases ────────────────────────────────────────
    void testDecodeRejectsMalformedJson();
    void testDecodeRejectsNonObject();
    void testDecodeRejectsOversizedLine();

    // ── Transport ────────────────────────────────────────────────
    void testInputReadClassification();
};

// ── Framing ──────────────────────────────────────────────────────

void TestServiceMessage::testEncodeIsSingleLine()
{
    const QByteArray line = vd::ServiceMessage::encodeLine(
        QJsonObject{{QStringLiteral("text"), QStringLiteral("a\nb")}});
    QVERIFY(line.endsWith('\n'));
    QCOMPARE(line.count('\n'), 1);
}

void TestServiceMessage::testDecodeRoundtrip()
{
    const QJsonObject request = vd::ServiceMessage::makeRequest(
        5, QStringLiteral("predict"), QJsonObject{{QStringLiteral("content"), QStringLiteral("hello")}});
    const std::optional<QJsonObject> decoded =
        vd::ServiceMessage::decodeLine(vd::ServiceMessage::encodeLine(request));
    QVERIFY(decoded);
    QCOMPARE(*decoded, request);
}

void TestServiceMessage::testUnicodeContentSurvives()
{
    const QString text = QStringLiteral("Grüße, 東京 🚀");
    const std::optional<QJsonObject> decoded = vd::ServiceMessage::decodeLine(
        vd::ServiceMessage::encodeLine(QJsonObject{{QStringLiteral("content"), text}}));
    QVERIFY(decoded);
    QCOMPARE(decoded->value(QStringLiteral("content")).toString(), text);
}

// ── Envelopes ────────────────────────────────────────────────────

void TestServiceMessage::testMakeRequestOmitsEmptyParams()
{
    const QJsonObject request = vd::ServiceMessage::makeRequest(1, QStringLiteral("status"));
    QCOMPARE(request.value(QStringLiteral("method")).toString(), QStringLiteral("status"));
    QVERIFY(!request.contains(QStringLiteral("params")));
}

void TestServiceMessage::testMakeResponseStructure()
{
    const QJsonObject response = vd::ServiceMessage::makeResponse(
        QStringLiteral("abc"), QJsonObject{{QStringLiteral("ok"), true}});
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QCOMPARE(response.value(QStringLiteral("id")).toString(), QStringLiteral("abc"));
    QVERIFY(response.value(QStringLiteral("result")).toObject().value(QStringLiteral("ok")).toBool());
}

void TestServiceMessage::testMakeErrorStructure()
{
    const QJsonObject error = vd::ServiceMessage::makeError(
        9, vd::ServiceErrorCode::ServiceUnavailable, QStringLiteral("Engine not initialized"));
    QCOMPARE(error.value(QStringLiteral("type")).toString(), QStringLiteral("error"));
    const QJsonObject body = error.value(QStringLiteral("error")).toObject();
    QCOMPARE(body.value(QStringLiteral("code")).toInt(), 9);
    QCOMPARE(body.value(QStringLiteral("codeString")).toString(), QStringLiteral("SERVICE_UNAVAILABLE"));
    QCOMPARE(body.value(QStringLiteral("message")).toString(), QStringLiteral("Engine not initialized"));

    QCOMPARE(vd::serviceErrorCodeToString(vd::ServiceErrorCode::InvalidParams),
             QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(vd::serviceErrorCodeToString(vd::ServiceErrorCode::NotFound), QStringLiteral("NOT_FOUND"));
}

// ── Decode edge cases ────────────────────────────────────────────

void TestServiceMessage::testDecodeRejectsMalformedJson()
{
    QString error;
    QVERIFY(!vd::ServiceMessage::decodeLine(QByteArrayLiteral("{\"id\": 1,"), &error));
    QVERIFY(!error.isEmpty());
}

void TestServiceMessage::testDecodeRejectsNonObject()
{
    QString error;
    QVERIFY(!vd::ServiceMessage::decodeLine(QByteArrayLiteral("[1, 2, 3]"), &error));
    QCOMPARE(error, QStringLiteral("expected a JSON object"));
}

void TestServiceMessage::testDecodeRejectsOversizedLine()
{
    const QByteArray huge(vd::ServiceMessage::kMaxLineSize + 1, ' ');
    QString error;
    QVERIFY(!vd::ServiceMessage::decodeLine(huge, &error));
    QVERIFY(error.startsWith(QStringLiteral("message exceeds")));
}

// ── Transport ────────────────────────────────────────────────────

void TestServiceMessage::testInputReadClassification()
{
    QVERIFY(vd::classifyInputRead(12, 0) == vd::InputReadStatus::Data);
    QVERIFY(vd::classifyInputRead(0, 0) == vd::InputReadStatus::Closed);
    QVERIFY(vd::classifyInputRead(-1, EINTR) == vd::InputReadStatus::Retry);
    QVERIFY(vd::classifyInputRead(-1, EAGAIN) == vd::InputReadStatus::Retry);
    QVERIFY(vd::classifyInputRead(-1, EWOULDBLOCK) == vd::InputReadStatus::Retry);
    QVERIFY(vd::classifyInputRead(-1, EBADF) == vd::InputReadStatus::Closed);
    QVERIFY(vd::classifyInputRead(-1, EIO) == vd::InputReadStatus::Closed);
}

QTEST_MAIN(TestServiceMessage)
#include "test_service_message.moc"

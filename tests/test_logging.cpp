#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace logging = gpuscrub::logging;

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testTranscriptReceivesEvents();
    void testDebugNeedsTrace();
    void testCorrelationScope();
    void testAnnounceIsRecorded();
    void testFallbackLogWithoutTranscript();
    void testTranscriptFileName();

private:
    std::vector<nlohmann::json> readEvents(const QString &path);

    QTemporaryDir m_tempDir;
    QByteArray m_prevLogDir;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevLogDir = qgetenv("GPUSCRUB_LOG_DIR");
    qputenv("GPUSCRUB_LOG_DIR", m_tempDir.filePath(QStringLiteral("logs")).toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevLogDir.isEmpty()) {
        qunsetenv("GPUSCRUB_LOG_DIR");
    } else {
        qputenv("GPUSCRUB_LOG_DIR", m_prevLogDir);
    }
}

std::vector<nlohmann::json> LoggingTests::readEvents(const QString &path)
{
    std::vector<nlohmann::json> events;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return events;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            events.push_back(nlohmann::json::parse(line.toStdString()));
        }
    }
    return events;
}

void LoggingTests::testTranscriptReceivesEvents()
{
    const QString transcript = m_tempDir.filePath(QStringLiteral("run/gpuscrub-test.log"));
    logging::initLogging(QStringLiteral("gpuscrub-test"), transcript, false);
    QCOMPARE(logging::transcriptPath(), transcript);

    GSLOG_INFO(QStringLiteral("Test"),
               QStringLiteral("testTranscriptReceivesEvents"),
               QStringLiteral("test_log"),
               QStringLiteral("unit_test"),
               QStringLiteral("direct_call"),
               logging::defaultWho(),
               QStringLiteral("corr-1"),
               (nlohmann::json{{"key", "value"}}));

    const auto events = readEvents(transcript);
    QCOMPARE(events.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(events[0].value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(events[0].value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(events[0].value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(events[0].value("process", "")), QStringLiteral("gpuscrub-test"));
    QCOMPARE(QString::fromStdString(events[0]["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugNeedsTrace()
{
    const QString quiet = m_tempDir.filePath(QStringLiteral("quiet.log"));
    logging::initLogging(QStringLiteral("gpuscrub-test"), quiet, false);
    QVERIFY(!logging::isTraceEnabled());
    GSLOG_DEBUG(QStringLiteral("Test"), QStringLiteral("testDebugNeedsTrace"),
                QStringLiteral("hidden"), QString(), QString(), QString(), QString(),
                nlohmann::json::object());
    QVERIFY(readEvents(quiet).empty());

    const QString traced = m_tempDir.filePath(QStringLiteral("traced.log"));
    logging::initLogging(QStringLiteral("gpuscrub-test"), traced, true);
    QVERIFY(logging::isTraceEnabled());
    GSLOG_DEBUG(QStringLiteral("Test"), QStringLiteral("testDebugNeedsTrace"),
                QStringLiteral("shown"), QString(), QString(), QString(), QString(),
                nlohmann::json::object());
    const auto events = readEvents(traced);
    QCOMPARE(events.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(events[0].value("level", "")), QStringLiteral("DEBUG"));
}

void LoggingTests::testCorrelationScope()
{
    const QString transcript = m_tempDir.filePath(QStringLiteral("corr.log"));
    logging::initLogging(QStringLiteral("gpuscrub-test"), transcript, false);

    {
        logging::CorrelationScope scope(QStringLiteral("run-42"));
        QCOMPARE(logging::currentCorrelationId(), QStringLiteral("run-42"));
        GSLOG_WARN(QStringLiteral("Test"), QStringLiteral("testCorrelationScope"),
                   QStringLiteral("scoped"), QString(), QString(), QString(), QString(),
                   nlohmann::json::object());
    }
    QVERIFY(logging::currentCorrelationId().isEmpty());

    const auto events = readEvents(transcript);
    QCOMPARE(events.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(events[0].value("corr", "")), QStringLiteral("run-42"));
}

void LoggingTests::testAnnounceIsRecorded()
{
    const QString transcript = m_tempDir.filePath(QStringLiteral("announce.log"));
    logging::initLogging(QStringLiteral("gpuscrub-test"), transcript, false);

    logging::announce(QStringLiteral("Remediator"), QStringLiteral("Purging: rocm-dev"));

    const auto events = readEvents(transcript);
    QCOMPARE(events.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(events[0].value("what", "")), QStringLiteral("console_message"));
    QCOMPARE(QString::fromStdString(events[0].value("component", "")), QStringLiteral("Remediator"));
    QCOMPARE(QString::fromStdString(events[0]["context"].value("message", "")),
             QStringLiteral("Purging: rocm-dev"));
}

void LoggingTests::testFallbackLogWithoutTranscript()
{
    logging::initLogging(QStringLiteral("gpuscrub-test"), QString(), false);
    QCOMPARE(logging::logsDirPath(), m_tempDir.filePath(QStringLiteral("logs")));

    GSLOG_ERROR(QStringLiteral("Test"), QStringLiteral("testFallbackLogWithoutTranscript"),
                QStringLiteral("fallback"), QString(), QString(), QString(), QString(),
                nlohmann::json::object());

    const auto events = readEvents(m_tempDir.filePath(QStringLiteral("logs/gpuscrub-test.log")));
    QCOMPARE(events.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(events[0].value("level", "")), QStringLiteral("ERROR"));
}

void LoggingTests::testTranscriptFileName()
{
    const QDateTime when(QDate(2025, 4, 17), QTime(9, 5, 3));
    QCOMPARE(logging::transcriptFileName(QStringLiteral("gpuscrub-userland"), when),
             QStringLiteral("gpuscrub-userland-20250417-090503.log"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"

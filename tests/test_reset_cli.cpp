#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "cli/ResetCli.hpp"
#include "fake_host.hpp"

using namespace gpuscrub;
using gpuscrub::testing::FakeHost;
using gpuscrub::testing::writeHostFile;

class ResetCliTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();
    void testDefaults();
    void testFlags();
    void testEnvironmentFallbacks();
    void testUsageErrors();
    void testHelp();
    void testUnknownFlagExitsTwo();
    void testBrokenPolicyExitsTwo();
    void testNonRootExitsOne();
    void testDryRunWritesReport();
    void testAutoRebootCallsSystemctl();

private:
    QStringList baseArguments() const;
    QStringList reportFiles() const;

    std::unique_ptr<QTemporaryDir> m_root;
    std::unique_ptr<QTemporaryDir> m_logDir;
};

static const char *const kEnvironment[] = {"GPUSCRUB_ROOT", "GPUSCRUB_LOG_DIR",
                                           "GPUSCRUB_BACKUP_DIR", "GPUSCRUB_TRACE",
                                           "GPUSCRUB_RELEASE_DELAY"};

void ResetCliTests::init()
{
    for (const char *variable : kEnvironment) {
        qunsetenv(variable);
    }
    m_root = std::make_unique<QTemporaryDir>();
    m_logDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_root->isValid());
    QVERIFY(m_logDir->isValid());
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/os-release"),
                          "VERSION_ID=\"25.04\"\n"));
}

void ResetCliTests::cleanup()
{
    for (const char *variable : kEnvironment) {
        qunsetenv(variable);
    }
}

QStringList ResetCliTests::baseArguments() const
{
    return {QStringLiteral("gpuscrub"),
            QStringLiteral("--root"), m_root->path(),
            QStringLiteral("--log-dir"), m_logDir->path()};
}

QStringList ResetCliTests::reportFiles() const
{
    return QDir(m_logDir->path())
        .entryList({QStringLiteral("*.report.json")}, QDir::Files, QDir::Name);
}

void ResetCliTests::testDefaults()
{
    QString error;
    const auto options = parseRunOptions({QStringLiteral("gpuscrub")}, &error);
    QVERIFY(options.has_value());
    QCOMPARE(options->mode, ResetMode::Full);
    QVERIFY(!options->autoReboot);
    QVERIFY(!options->dryRun);
    QVERIFY(!options->trace);
    QCOMPARE(options->root, QStringLiteral("/"));
    QVERIFY(options->logDir.isEmpty());
    QCOMPARE(options->releaseDelaySeconds, -1);
}

void ResetCliTests::testFlags()
{
    QString error;
    const auto options = parseRunOptions(
        {QStringLiteral("gpuscrub"), QStringLiteral("--userland-only"),
         QStringLiteral("--auto-reboot"), QStringLiteral("--dry-run"), QStringLiteral("--trace"),
         QStringLiteral("--root"), QStringLiteral("/mnt/target"),
         QStringLiteral("--backup-dir"), QStringLiteral("/srv/backups"),
         QStringLiteral("--policy"), QStringLiteral("/etc/gpuscrub/policy.json"),
         QStringLiteral("--expected-release"), QStringLiteral("24.04")},
        &error);
    QVERIFY2(options.has_value(), qPrintable(error));
    QCOMPARE(options->mode, ResetMode::Userland);
    QVERIFY(options->autoReboot);
    QVERIFY(options->dryRun);
    QVERIFY(options->trace);
    QCOMPARE(options->root, QStringLiteral("/mnt/target"));
    QCOMPARE(options->backupDir, QStringLiteral("/srv/backups"));
    QCOMPARE(options->policyFile, QStringLiteral("/etc/gpuscrub/policy.json"));
    QCOMPARE(options->expectedRelease, QStringLiteral("24.04"));
}

void ResetCliTests::testEnvironmentFallbacks()
{
    qputenv("GPUSCRUB_ROOT", "/mnt/env-root");
    qputenv("GPUSCRUB_LOG_DIR", "/tmp/env-logs");
    qputenv("GPUSCRUB_TRACE", "1");
    qputenv("GPUSCRUB_RELEASE_DELAY", "0");

    QString error;
    auto options = parseRunOptions({QStringLiteral("gpuscrub")}, &error);
    QVERIFY2(options.has_value(), qPrintable(error));
    QCOMPARE(options->root, QStringLiteral("/mnt/env-root"));
    QCOMPARE(options->logDir, QStringLiteral("/tmp/env-logs"));
    QVERIFY(options->trace);
    QCOMPARE(options->releaseDelaySeconds, 0);

    // Flags win over the environment.
    options = parseRunOptions({QStringLiteral("gpuscrub"), QStringLiteral("--root"),
                               QStringLiteral("/mnt/flag-root")},
                              &error);
    QVERIFY(options.has_value());
    QCOMPARE(options->root, QStringLiteral("/mnt/flag-root"));
}

void ResetCliTests::testUsageErrors()
{
    QString error;
    QVERIFY(!parseRunOptions({QStringLiteral("gpuscrub"), QStringLiteral("--bogus")}, &error));
    QVERIFY(!error.isEmpty());

    error.clear();
    QVERIFY(!parseRunOptions({QStringLiteral("gpuscrub"), QStringLiteral("now")}, &error));
    QVERIFY(error.contains(QStringLiteral("now")));

    qputenv("GPUSCRUB_RELEASE_DELAY", "-3");
    error.clear();
    QVERIFY(!parseRunOptions({QStringLiteral("gpuscrub")}, &error));
    QVERIFY(error.contains(QStringLiteral("GPUSCRUB_RELEASE_DELAY")));
}

void ResetCliTests::testHelp()
{
    QString error;
    const auto options = parseRunOptions({QStringLiteral("gpuscrub"), QStringLiteral("--help")},
                                         &error);
    QVERIFY(options.has_value());
    QVERIFY(options->helpRequested);
    QVERIFY(options->helpText.contains(QStringLiteral("--userland-only")));

    FakeHost host;
    ResetCli cli(host, 0);
    QCOMPARE(cli.run({QStringLiteral("gpuscrub"), QStringLiteral("--help")}), 0);
    QVERIFY(host.calls.empty());
}

void ResetCliTests::testUnknownFlagExitsTwo()
{
    FakeHost host;
    ResetCli cli(host, 0);
    QCOMPARE(cli.run({QStringLiteral("gpuscrub"), QStringLiteral("--nuke-everything")}), 2);
    QVERIFY(host.calls.empty());
}

void ResetCliTests::testBrokenPolicyExitsTwo()
{
    const QString policyPath = m_logDir->filePath(QStringLiteral("policy.json"));
    QFile policy(policyPath);
    QVERIFY(policy.open(QIODevice::WriteOnly));
    policy.write(R"({"collect": ["firmware"]})");
    policy.close();

    FakeHost host;
    ResetCli cli(host, 0);
    QCOMPARE(cli.run(baseArguments() << QStringLiteral("--policy") << policyPath), 2);
    QVERIFY(host.calls.empty());

    QVERIFY(policy.open(QIODevice::WriteOnly | QIODevice::Truncate));
    policy.write(R"({"packagePatterns": ["^rocm(-.*$"]})");
    policy.close();
    QCOMPARE(cli.run(baseArguments() << QStringLiteral("--policy") << policyPath), 2);
    QVERIFY(host.calls.empty());
}

void ResetCliTests::testNonRootExitsOne()
{
    FakeHost host;
    host.addPackage("rocm-dev");
    ResetCli cli(host, 1000);
    QCOMPARE(cli.run(baseArguments()), 1);
    QVERIFY(host.isInstalled("rocm-dev"));
    QVERIFY(host.calls.empty());
}

void ResetCliTests::testDryRunWritesReport()
{
    FakeHost host;
    host.addPackage("rocm-dev");
    ResetCli cli(host, 1000);
    QCOMPARE(cli.run(baseArguments() << QStringLiteral("--dry-run")), 0);
    QVERIFY(host.isInstalled("rocm-dev"));

    const QStringList reports = reportFiles();
    QCOMPARE(reports.size(), 1);
    QVERIFY(reports.front().startsWith(QStringLiteral("gpuscrub-")));

    QFile file(QDir(m_logDir->path()).filePath(reports.front()));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const nlohmann::json doc = nlohmann::json::parse(file.readAll().toStdString());
    QVERIFY(doc.value("dryRun", false));
    QCOMPARE(doc.at("actions").size(), static_cast<size_t>(1));

    // The transcript sits next to the report.
    QString transcript = reports.front();
    transcript.chop(QStringLiteral(".report.json").size());
    QVERIFY(QFile::exists(QDir(m_logDir->path()).filePath(transcript)));
}

void ResetCliTests::testAutoRebootCallsSystemctl()
{
    FakeHost host;
    ResetCli cli(host, 0);
    cli.setRebootDelaySeconds(0);
    QCOMPARE(cli.run(baseArguments() << QStringLiteral("--userland-only")
                                     << QStringLiteral("--auto-reboot")),
             0);
    QCOMPARE(host.calls.back(), QStringLiteral("systemctl reboot"));
    QVERIFY(reportFiles().front().startsWith(QStringLiteral("gpuscrub-userland-")));

    // A dry run never reboots.
    FakeHost dryHost;
    ResetCli dryCli(dryHost, 0);
    dryCli.setRebootDelaySeconds(0);
    QCOMPARE(dryCli.run(baseArguments() << QStringLiteral("--auto-reboot")
                                        << QStringLiteral("--dry-run")),
             0);
    QCOMPARE(dryHost.countCalls(QStringLiteral("systemctl")), 0);
}

QTEST_MAIN(ResetCliTests)
#include "test_reset_cli.moc"

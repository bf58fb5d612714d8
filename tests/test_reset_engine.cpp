#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <algorithm>

#include <nlohmann/json.hpp>

#include "common/host_layout.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/reset_engine.hpp"
#include "fake_host.hpp"

using namespace gpuscrub;
using gpuscrub::testing::FakeHost;
using gpuscrub::testing::readHostFile;
using gpuscrub::testing::writeHostFile;

namespace {

const QByteArray kRadvIcd =
    R"({"file_format_version": "1.0.0", "ICD": {"library_path": "/usr/lib/x86_64-linux-gnu/libvulkan_radeon.so", "api_version": "1.3.275"}})";
const QByteArray kAmdvlkIcd =
    R"({"file_format_version": "1.0.0", "ICD": {"library_path": "/opt/amdgpu-pro/lib/x86_64-linux-gnu/amdvlk64.so", "api_version": "1.3.280"}})";

const ClassificationResult *findClassification(const RunReport &report, ItemKind kind,
                                               const std::string &name)
{
    for (const auto &result : report.classifications) {
        if (result.item.kind == kind && result.item.name == name) {
            return &result;
        }
    }
    return nullptr;
}

} // namespace

class ResetEngineTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void testPurgesForeignPackage();
    void testDisablesRadeonSource();
    void testLeavesRadvIcdAlone();
    void testQuarantinesForeignIcd();
    void testCleanHostStillRestores();
    void testSecondRunFindsNothing();
    void testStagesAndRemediationPrecedeRestoration();
    void testDryRunChangesNothing();
    void testPreconditionStopsRun();
    void testReportIsWritten();
    void testUserlandLeavesKernelSideAlone();
    void testLatin1SourceFilesReachDone();

private:
    EngineResult runEngine(ResetMode mode, bool dryRun = false, unsigned euid = 0,
                           const QString &reportPath = QString());

    QTemporaryDir m_logDir;
    std::unique_ptr<QTemporaryDir> m_root;
    std::unique_ptr<HostLayout> m_layout;
    FakeHost m_host;
};

void ResetEngineTests::initTestCase()
{
    QVERIFY(m_logDir.isValid());
    logging::initLogging(QStringLiteral("gpuscrub-test"),
                         m_logDir.filePath(QStringLiteral("transcript.log")), true);
}

void ResetEngineTests::init()
{
    m_root = std::make_unique<QTemporaryDir>();
    QVERIFY(m_root->isValid());
    m_layout = std::make_unique<HostLayout>(m_root->path());
    m_host = FakeHost();
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/os-release"),
                          "NAME=\"Ubuntu\"\nVERSION_ID=\"25.04\"\n"));
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/apt/sources.list"),
                          "deb http://archive.ubuntu.com/ubuntu plucky main\n"));
    m_host.addPackage("mesa-vulkan-drivers", "25.0.7-0ubuntu0.25.04.1");
    m_host.addPackage("libdrm2", "2.4.124-2");
}

EngineResult ResetEngineTests::runEngine(ResetMode mode, bool dryRun, unsigned euid,
                                         const QString &reportPath)
{
    const RulePolicy policy = RulePolicy::defaults(mode);
    ResetEngine engine(m_host, policy, *m_layout);
    EngineOptions options;
    options.dryRun = dryRun;
    options.effectiveUid = euid;
    options.releaseDelaySeconds = 0;
    options.reportPath = reportPath;
    return engine.run(options);
}

void ResetEngineTests::testPurgesForeignPackage()
{
    m_host.addPackage("rocm-dev", "6.1.0.60100-82~24.04");

    const EngineResult result = runEngine(ResetMode::Full);
    QVERIFY(!result.precondition);

    const ClassificationResult *rocm =
        findClassification(result.report, ItemKind::Package, "rocm-dev");
    QVERIFY(rocm);
    QCOMPARE(rocm->label, Label::Foreign);
    QCOMPARE(QString::fromStdString(rocm->ruleId), QStringLiteral("package:^rocm(-.*)?$"));
    QCOMPARE(findClassification(result.report, ItemKind::Package, "libdrm2")->label, Label::Stock);

    QVERIFY(!m_host.isInstalled("rocm-dev"));
    QCOMPARE(result.report.failureCount(), static_cast<size_t>(0));

    // Collected again, the package is gone.
    const EngineResult again = runEngine(ResetMode::Full, true);
    QVERIFY(!findClassification(again.report, ItemKind::Package, "rocm-dev"));
}

void ResetEngineTests::testDisablesRadeonSource()
{
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/apt/sources.list.d/amdgpu.list"),
                          "deb https://repo.radeon.com/amdgpu/6.1/ubuntu noble main\n"));

    const EngineResult result = runEngine(ResetMode::Full);
    QCOMPARE(result.report.actions.size(), static_cast<size_t>(1));
    const RemediationAction &action = result.report.actions.front();
    QCOMPARE(action.kind, ActionKind::DisableSource);

    const QString original = m_layout->path(QStringLiteral("/etc/apt/sources.list.d/amdgpu.list"));
    QVERIFY(!QFile::exists(original));
    QVERIFY(QString::fromStdString(action.backupPath).startsWith(original + QStringLiteral(".disabled.")));
    QVERIFY(QFile::exists(QString::fromStdString(action.backupPath)));
    // The pre-change copy of every source file is kept as well.
    QVERIFY(QFile::exists(m_layout->path(QStringLiteral("/etc/apt/sources.list.d.bak/amdgpu.list"))));
}

void ResetEngineTests::testLeavesRadvIcdAlone()
{
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/vulkan/icd.d/radeon_icd.x86_64.json"),
                          kRadvIcd));

    const EngineResult result = runEngine(ResetMode::Full);
    const ClassificationResult *icd =
        findClassification(result.report, ItemKind::VulkanICD, "radeon_icd.x86_64.json");
    QVERIFY(icd);
    QCOMPARE(icd->label, Label::Stock);
    QVERIFY(result.report.actions.empty());
    QCOMPARE(readHostFile(m_root->path(), QStringLiteral("/etc/vulkan/icd.d/radeon_icd.x86_64.json")),
             kRadvIcd);
}

void ResetEngineTests::testQuarantinesForeignIcd()
{
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/vulkan/icd.d/amd_icd64.json"),
                          kAmdvlkIcd));

    const EngineResult result = runEngine(ResetMode::Full);
    QCOMPARE(result.report.actions.size(), static_cast<size_t>(1));
    const RemediationAction &action = result.report.actions.front();
    QCOMPARE(action.kind, ActionKind::QuarantineFile);
    QVERIFY(QString::fromStdString(action.backupPath)
                .startsWith(m_layout->backupPath(QStringLiteral("vulkan-icd-bak"))));

    QVERIFY(!QFile::exists(m_layout->path(QStringLiteral("/etc/vulkan/icd.d/amd_icd64.json"))));
    QFile quarantined(QString::fromStdString(action.backupPath));
    QVERIFY(quarantined.open(QIODevice::ReadOnly));
    QCOMPARE(quarantined.readAll(), kAmdvlkIcd);
}

void ResetEngineTests::testCleanHostStillRestores()
{
    const EngineResult result = runEngine(ResetMode::Full);
    QVERIFY(!result.precondition);
    QVERIFY(result.report.actions.empty());
    QCOMPARE(m_host.countCalls(QStringLiteral("dkms remove")), 0);
    QCOMPARE(m_host.indexOfCall(QStringLiteral("apt-get -y -o Dpkg::Options::=--force-confnew "
                                               "-o Dpkg::Options::=--force-confdef purge")),
             -1);

    const auto &steps = result.report.executedSteps;
    QVERIFY(std::find(steps.begin(), steps.end(), "install-stock-packages") != steps.end());
    QVERIFY(std::find(steps.begin(), steps.end(), "update-bootloader") != steps.end());
    QCOMPARE(result.report.finalStage, Stage::Done);
    QCOMPARE(result.report.failureCount(), static_cast<size_t>(0));
    QVERIFY(m_host.isInstalled("linux-generic"));
}

void ResetEngineTests::testSecondRunFindsNothing()
{
    m_host.addPackage("rocm-dev", "6.1.0");
    m_host.addPackage("amdvlk", "2024.Q2.1");
    m_host.addModuleBuild("amdgpu", "6.7.0-1756574.24.04");
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/apt/sources.list.d/rocm.list"),
                          "deb https://repo.radeon.com/rocm/apt/6.1 noble main\n"));
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/apt/preferences.d/rocm-pin-600"),
                          "Package: *\nPin: release o=repo.radeon.com\nPin-Priority: 600\n"));
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/modprobe.d/blacklist-radeon.conf"),
                          "blacklist radeon\n"));
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/OpenCL/vendors/amdocl64.icd"),
                          "libamdocl64.so\n"));
    QVERIFY(QDir().mkpath(m_layout->path(QStringLiteral("/opt/rocm-6.1.0/bin"))));

    const EngineResult first = runEngine(ResetMode::Full);
    QVERIFY(first.report.actions.size() >= 8);

    const EngineResult second = runEngine(ResetMode::Full);
    QVERIFY2(second.report.actions.empty(),
             nlohmann::json(second.report.actions).dump().c_str());
    QVERIFY(!QFileInfo::exists(m_layout->path(QStringLiteral("/opt/rocm-6.1.0"))));
    QVERIFY(m_host.dkms.empty());
}

void ResetEngineTests::testStagesAndRemediationPrecedeRestoration()
{
    m_host.addPackage("rocm-dev", "6.1.0");
    m_host.addModuleBuild("amdgpu", "6.7.0-1756574.24.04");

    const EngineResult result = runEngine(ResetMode::Full);
    const std::vector<Stage> expected = {Stage::Collecting, Stage::Classifying, Stage::Remediating,
                                         Stage::Restoring, Stage::Done};
    QVERIFY(result.report.stages == expected);

    // Every destructive command lands before the first restoring one.
    const int purge = m_host.indexOfCall(QStringLiteral("apt-get -y -o Dpkg::Options::=--force-confnew "
                                                        "-o Dpkg::Options::=--force-confdef purge"));
    const int dkms = m_host.indexOfCall(QStringLiteral("dkms remove"));
    const int install = m_host.indexOfCall(QStringLiteral("apt-get -y -o Dpkg::Options::=--force-confnew "
                                                          "-o Dpkg::Options::=--force-confdef install"));
    QVERIFY(purge >= 0);
    QVERIFY(dkms > purge);
    QVERIFY(install > dkms);

    const auto &steps = result.report.executedSteps;
    const auto lastRemediation = std::find(steps.begin(), steps.end(), "refresh-metadata-again");
    const auto firstRestoration = std::find(steps.begin(), steps.end(), "restore-refresh");
    QVERIFY(lastRemediation != steps.end());
    QVERIFY(firstRestoration == lastRemediation + 1);
}

void ResetEngineTests::testDryRunChangesNothing()
{
    m_host.addPackage("rocm-dev", "6.1.0");
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/vulkan/icd.d/amd_icd64.json"),
                          kAmdvlkIcd));

    const EngineResult result = runEngine(ResetMode::Full, true, 1000);
    QVERIFY(!result.precondition);
    QCOMPARE(result.report.actions.size(), static_cast<size_t>(2));
    QVERIFY(result.report.executedSteps.empty());
    QVERIFY(result.report.outcomes.empty());
    QCOMPARE(result.report.finalStage, Stage::Classifying);

    QVERIFY(m_host.isInstalled("rocm-dev"));
    QVERIFY(QFile::exists(m_layout->path(QStringLiteral("/etc/vulkan/icd.d/amd_icd64.json"))));
    for (const auto &call : m_host.calls) {
        QVERIFY2(!call.startsWith(QStringLiteral("apt-get")), qPrintable(call));
    }
}

void ResetEngineTests::testPreconditionStopsRun()
{
    m_host.addPackage("rocm-dev", "6.1.0");

    const EngineResult result = runEngine(ResetMode::Full, false, 1000);
    QVERIFY(result.precondition.has_value());
    QCOMPARE(result.precondition->failure, FailureClass::NotPrivileged);
    QCOMPARE(result.report.finalStage, Stage::Start);
    QVERIFY(result.report.inventory.empty());
    QVERIFY(m_host.calls.empty());
}

void ResetEngineTests::testReportIsWritten()
{
    m_host.addPackage("amdvlk", "2024.Q2.1");
    const QString reportPath = m_logDir.filePath(QStringLiteral("reports/run.report.json"));

    const EngineResult result = runEngine(ResetMode::Full, false, 0, reportPath);
    QFile file(reportPath);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const nlohmann::json doc = nlohmann::json::parse(file.readAll().toStdString());

    QCOMPARE(QString::fromStdString(doc.value("runId", "")),
             QString::fromStdString(result.report.runId));
    QCOMPARE(QString::fromStdString(doc.value("mode", "")), QStringLiteral("full"));
    QCOMPARE(QString::fromStdString(doc.value("finalStage", "")), QStringLiteral("done"));
    QCOMPARE(doc.at("actions").size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(doc.at("actions")[0].value("name", "")), QStringLiteral("amdvlk"));
    QCOMPARE(doc.value("failures", -1), 0);
}

void ResetEngineTests::testUserlandLeavesKernelSideAlone()
{
    m_host.addPackage("amdvlk", "2024.Q2.1");
    m_host.addPackage("rocm-dev", "6.1.0");
    m_host.addModuleBuild("amdgpu", "6.7.0-1756574.24.04");
    QVERIFY(writeHostFile(m_root->path(), QStringLiteral("/etc/modprobe.d/blacklist-radeon.conf"),
                          "blacklist radeon\n"));

    const EngineResult result = runEngine(ResetMode::Userland);
    QVERIFY(!m_host.isInstalled("amdvlk"));
    QVERIFY(m_host.isInstalled("rocm-dev"));
    QCOMPARE(m_host.dkms.size(), static_cast<size_t>(1));
    QCOMPARE(m_host.countCalls(QStringLiteral("dkms")), 0);
    QVERIFY(QFile::exists(m_layout->path(QStringLiteral("/etc/modprobe.d/blacklist-radeon.conf"))));
    QCOMPARE(m_host.countCalls(QStringLiteral("update-initramfs")), 0);
    QCOMPARE(m_host.countCalls(QStringLiteral("dpkg --add-architecture i386")), 1);
    QCOMPARE(result.report.finalStage, Stage::Done);
}

void ResetEngineTests::testLatin1SourceFilesReachDone()
{
    const QString root = m_root->path();
    QVERIFY(writeHostFile(root, QStringLiteral("/etc/apt/sources.list.d/amdgpu.list"),
                          "# d\xE9p\xF4t AMD\n"
                          "deb https://repo.radeon.com/amdgpu/6.1/ubuntu noble main\n"));
    QVERIFY(writeHostFile(root, QStringLiteral("/etc/apt/sources.list.d/local.list"),
                          "# miroir caf\xE9\ndeb http://fr.archive.ubuntu.com/ubuntu plucky main\n"));
    const QString reportPath = m_logDir.filePath(QStringLiteral("reports/latin1.report.json"));

    const EngineResult result = runEngine(ResetMode::Full, false, 0, reportPath);
    QVERIFY(!result.precondition);
    QVERIFY(!result.stoppedBy);
    QCOMPARE(result.report.finalStage, Stage::Done);
    QVERIFY(!QFile::exists(m_layout->path(QStringLiteral("/etc/apt/sources.list.d/amdgpu.list"))));
    QVERIFY(QFile::exists(m_layout->path(QStringLiteral("/etc/apt/sources.list.d/local.list"))));

    QFile file(reportPath);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const nlohmann::json doc = nlohmann::json::parse(file.readAll().toStdString());
    QCOMPARE(QString::fromStdString(doc.value("finalStage", "")), QStringLiteral("done"));
}

QTEST_MAIN(ResetEngineTests)
#include "test_reset_engine.moc"

#include "engine/host_tools.hpp"

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/error_policy.hpp"

namespace gpuscrub {

namespace {

const QString kUpdateAlternatives = QStringLiteral("update-alternatives");

std::string firstLine(const std::string &text)
{
    const auto end = text.find('\n');
    std::string line = end == std::string::npos ? text : text.substr(0, end);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

} // namespace

HostTools::HostTools(CommandRunner &runner)
    : m_runner(runner)
{
}

Outcome HostTools::runTool(const std::string &step, const std::string &subject,
                           const QString &program, const QStringList &arguments)
{
    const CommandResult result = m_runner.run(program, arguments);
    Outcome outcome = outcomeFromCommand(step, subject, program, arguments, result);
    logOutcome(QStringLiteral("HostTools"), outcome);
    return outcome;
}

std::optional<std::string> HostTools::runningKernel()
{
    const CommandResult result = m_runner.run(QStringLiteral("uname"), {QStringLiteral("-r")});
    if (!result.ok()) {
        return std::nullopt;
    }
    const std::string release = firstLine(result.stdoutText);
    if (release.empty()) {
        return std::nullopt;
    }
    return release;
}

Outcome HostTools::regenerateInitramfs(const std::string &step)
{
    const QString program = QStringLiteral("update-initramfs");
    const Outcome create = runTool(step, "initramfs", program,
                                   {QStringLiteral("-c"), QStringLiteral("-k"),
                                    QStringLiteral("all")});
    if (!create.failed()) {
        return create;
    }

    // -c refuses to overwrite existing images on most releases.
    GSLOG_INFO(QStringLiteral("HostTools"),
               QStringLiteral("regenerateInitramfs"),
               QStringLiteral("initramfs_create_refused"),
               QStringLiteral("existing_images"),
               QStringLiteral("fallback_update_mode"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"reason", create.reason}}));
    return runTool(step, "initramfs", program,
                   {QStringLiteral("-u"), QStringLiteral("-k"), QStringLiteral("all")});
}

Outcome HostTools::updateBootloader(const std::string &step)
{
    return runTool(step, "grub", QStringLiteral("update-grub"), {});
}

Outcome HostTools::loadModule(const std::string &step, const std::string &module)
{
    return runTool(step, module, QStringLiteral("modprobe"),
                   {QString::fromStdString(module)});
}

bool HostTools::hasAlternative(const std::string &name)
{
    const CommandResult result = m_runner.run(
        kUpdateAlternatives, {QStringLiteral("--list"), QString::fromStdString(name)});
    return result.ok();
}

Outcome HostTools::setAlternative(const std::string &step, const std::string &name,
                                  const std::string &path)
{
    return runTool(step, name, kUpdateAlternatives,
                   {QStringLiteral("--set"), QString::fromStdString(name),
                    QString::fromStdString(path)});
}

Outcome HostTools::autoAlternative(const std::string &step, const std::string &name)
{
    return runTool(step, name, kUpdateAlternatives,
                   {QStringLiteral("--auto"), QString::fromStdString(name)});
}

Outcome HostTools::ldconfig(const std::string &step)
{
    return runTool(step, "ldconfig", QStringLiteral("ldconfig"), {});
}

Outcome HostTools::reboot(const std::string &step)
{
    return runTool(step, "reboot", QStringLiteral("systemctl"), {QStringLiteral("reboot")});
}

} // namespace gpuscrub

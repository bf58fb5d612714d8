#include "engine/module_builder.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/error_policy.hpp"

namespace gpuscrub {

namespace {

const QString kDkms = QStringLiteral("dkms");

std::string trim(const std::string &value)
{
    const auto start = value.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r");
    return value.substr(start, end - start + 1);
}

std::vector<std::string> splitFields(const std::string &value)
{
    std::vector<std::string> fields;
    std::istringstream stream(value);
    std::string field;
    while (std::getline(stream, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

} // namespace

std::vector<ModuleBuildEntry> parseDkmsStatus(const std::string &output)
{
    std::vector<ModuleBuildEntry> entries;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        ModuleBuildEntry entry;
        std::string head = line;
        const auto colon = line.rfind(": ");
        if (colon != std::string::npos) {
            head = line.substr(0, colon);
            entry.state = trim(line.substr(colon + 2));
        }

        std::vector<std::string> fields = splitFields(head);
        if (fields.empty() || fields.front().empty()) {
            continue;
        }

        std::size_t next = 1;
        const auto slash = fields.front().find('/');
        if (slash != std::string::npos) {
            entry.name = fields.front().substr(0, slash);
            entry.version = fields.front().substr(slash + 1);
        } else {
            entry.name = fields.front();
            if (fields.size() > 1) {
                entry.version = fields[1];
                next = 2;
            }
        }
        if (entry.name.empty() || entry.version.empty()) {
            continue;
        }
        if (fields.size() > next) {
            entry.kernel = fields[next];
        }
        if (fields.size() > next + 1) {
            entry.architecture = fields[next + 1];
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

ModuleBuilder::ModuleBuilder(CommandRunner &runner)
    : m_runner(runner)
{
}

bool ModuleBuilder::isAvailable() const
{
    return m_runner.hasProgram(kDkms);
}

std::optional<std::vector<ModuleBuildEntry>> ModuleBuilder::status()
{
    if (!isAvailable()) {
        GSLOG_INFO(QStringLiteral("ModuleBuilder"),
                   QStringLiteral("status"),
                   QStringLiteral("dkms_absent"),
                   QStringLiteral("inventory"),
                   QStringLiteral("path_lookup"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return std::nullopt;
    }

    const CommandResult result = m_runner.run(kDkms, {QStringLiteral("status")});
    if (!result.ok()) {
        GSLOG_WARN(QStringLiteral("ModuleBuilder"),
                   QStringLiteral("status"),
                   QStringLiteral("dkms_status_failed"),
                   QStringLiteral("inventory"),
                   QStringLiteral("dkms_status"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"exitCode", result.exitCode},
                                   {"stderr", result.stderrText}}));
        return std::nullopt;
    }
    return parseDkmsStatus(result.stdoutText);
}

Outcome ModuleBuilder::remove(const std::string &step, const std::string &name,
                              const std::string &version)
{
    const QStringList args = {QStringLiteral("remove"),
                              QStringLiteral("-m"), QString::fromStdString(name),
                              QStringLiteral("-v"), QString::fromStdString(version),
                              QStringLiteral("--all")};
    const CommandResult result = m_runner.run(kDkms, args);
    Outcome outcome = outcomeFromCommand(step, name + "/" + version, kDkms, args, result);
    logOutcome(QStringLiteral("ModuleBuilder"), outcome);
    return outcome;
}

} // namespace gpuscrub

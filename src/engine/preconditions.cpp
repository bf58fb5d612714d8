#include "engine/preconditions.hpp"

#include <QFile>
#include <QTextStream>

namespace gpuscrub {

std::optional<PreconditionError> checkPreconditions(const CommandRunner &runner,
                                                    unsigned effectiveUid,
                                                    bool dryRun)
{
    if (!dryRun && effectiveUid != 0) {
        return PreconditionError{FailureClass::NotPrivileged,
                                 "must be run as root (try sudo)"};
    }
    if (!runner.hasProgram(QStringLiteral("apt-get"))) {
        return PreconditionError{FailureClass::PackageManagerMissing,
                                 "apt-get not found; only Debian/Ubuntu hosts are supported"};
    }
    if (!runner.hasProgram(QStringLiteral("dpkg-query"))) {
        return PreconditionError{FailureClass::PackageQueryMissing,
                                 "dpkg-query not found; cannot list installed packages"};
    }
    return std::nullopt;
}

std::string readOsReleaseField(const QString &path, const std::string &key)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return {};
    }

    const QString prefix = QString::fromStdString(key) + QChar('=');
    QTextStream stream(&file);
    while (!stream.atEnd()) {
        const QString line = stream.readLine().trimmed();
        if (!line.startsWith(prefix)) {
            continue;
        }
        QString value = line.mid(prefix.size());
        if (value.size() >= 2
            && (value.startsWith(QChar('"')) || value.startsWith(QChar('\'')))
            && value.endsWith(value.front())) {
            value = value.mid(1, value.size() - 2);
        }
        return value.toStdString();
    }
    return {};
}

ReleaseCheck checkRelease(const HostLayout &layout, const std::string &expected)
{
    ReleaseCheck check;
    check.expected = expected;
    check.found = readOsReleaseField(layout.path(QStringLiteral("/etc/os-release")),
                                     "VERSION_ID");
    return check;
}

} // namespace gpuscrub

#include "common/host_layout.hpp"

#include <QDir>

namespace gpuscrub {

namespace {

QString stripTrailingSlash(QString value)
{
    while (value.size() > 1 && value.endsWith(QChar('/'))) {
        value.chop(1);
    }
    return value;
}

} // namespace

HostLayout::HostLayout(const QString &root, const QString &backupRoot)
    : m_root(stripTrailingSlash(root.isEmpty() ? QStringLiteral("/") : root))
{
    m_backupRoot = backupRoot.isEmpty()
        ? path(QStringLiteral("/var/backups"))
        : stripTrailingSlash(backupRoot);
}

QString HostLayout::path(const QString &hostPath) const
{
    QString relative = hostPath;
    while (relative.startsWith(QChar('/'))) {
        relative.remove(0, 1);
    }
    if (m_root == QStringLiteral("/")) {
        return QStringLiteral("/") + relative;
    }
    return QDir::cleanPath(m_root + QChar('/') + relative);
}

QString HostLayout::backupPath(const QString &subdir) const
{
    return QDir::cleanPath(m_backupRoot + QChar('/') + subdir);
}

} // namespace gpuscrub

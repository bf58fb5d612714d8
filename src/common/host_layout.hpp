#pragma once

#include <QString>

namespace gpuscrub {

/**
 * Resolves absolute host paths ("/etc/apt/sources.list.d") under a root
 * prefix so a run can target a chroot or a test directory.
 */
class HostLayout
{
public:
    explicit HostLayout(const QString &root = QStringLiteral("/"),
                        const QString &backupRoot = QString());

    QString root() const { return m_root; }
    QString backupRoot() const { return m_backupRoot; }

    QString path(const QString &hostPath) const;
    QString backupPath(const QString &subdir) const;

private:
    QString m_root;
    QString m_backupRoot;
};

} // namespace gpuscrub

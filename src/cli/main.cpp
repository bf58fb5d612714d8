#include <QCoreApplication>

#include "cli/ResetCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("gpuscrub"));

    gpuscrub::ResetCli cli;
    return cli.run(QCoreApplication::arguments());
}

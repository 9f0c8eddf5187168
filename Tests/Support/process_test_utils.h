#pragma once

#include <QByteArray>
#include <QString>

namespace oni::test {

bool writeExecutableScript(const QString& path, const QByteArray& contents);

// Shell script that replaces itself with a long sleep, so the pid QProcess
// reports is the process that has to be killed.
bool writeSleeperScript(const QString& path, int seconds = 30);

bool processIsAlive(qint64 pid);

} // namespace oni::test

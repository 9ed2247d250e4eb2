#include "ProcessRunner.h"
#include <QProcess>

QString ProcessResult::diagnosticTail(int maxLines) const {
    QStringList lines = QString::fromUtf8(standardError).split('\n', Qt::SkipEmptyParts);
    if (lines.size() > maxLines)
        lines = lines.mid(lines.size() - maxLines);
    return lines.join(" | ").trimmed();
}

QtProcessRunner::QtProcessRunner(int timeoutMs) : m_timeoutMs(timeoutMs) {}

ProcessResult QtProcessRunner::run(const QString& program, const QStringList& arguments) {
    ProcessResult result;

    QProcess process;
    process.setProgram(program);
    process.setArguments(arguments);
    process.setStandardInputFile(QProcess::nullDevice());
    process.start();

    if (!process.waitForStarted()) {
        result.standardError = process.errorString().toUtf8();
        return result;
    }
    result.started = true;

    if (!process.waitForFinished(m_timeoutMs)) {
        process.kill();
        process.waitForFinished();
        result.crashed = true;
        result.standardError = process.readAllStandardError();
        result.standardError.append("\nprocess timed out");
        return result;
    }

    result.crashed = process.exitStatus() == QProcess::CrashExit;
    result.exitCode = process.exitCode();
    result.standardOutput = process.readAllStandardOutput();
    result.standardError = process.readAllStandardError();
    return result;
}

#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

struct ProcessResult {
    bool started = false;
    bool crashed = false;
    int exitCode = -1;
    QByteArray standardOutput;
    QByteArray standardError;

    bool succeeded() const { return started && !crashed && exitCode == 0; }

    // Last lines of stderr, enough to explain a failure in a log line
    QString diagnosticTail(int maxLines = 5) const;
};

// Runs an external program to completion. Encoder invocations go through this
// seam so tests can script the encoder's behavior.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const QString& program, const QStringList& arguments) = 0;
};

class QtProcessRunner : public ProcessRunner {
public:
    explicit QtProcessRunner(int timeoutMs = -1);

    ProcessResult run(const QString& program, const QStringList& arguments) override;

private:
    int m_timeoutMs;
};

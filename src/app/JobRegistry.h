#pragma once

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QThread>
#include <functional>
#include <memory>
#include <vector>
#include "JobConfig.h"

class JobRegistry;
class ProcessRunner;

enum class JobStatus {
    Running,
    Done,
    Error
};

QString jobStatusName(JobStatus status);

struct ExportJob {
    QString id;
    JobStatus status = JobStatus::Running;
    int progress = 0;           // 0..100, never decreases
    QString outputPath;
    QString message;            // failure cause when status is Error
};

// Runs one job's pipeline on its own thread and reports back to the registry.
class ExportWorker : public QThread {
    Q_OBJECT
public:
    ExportWorker(JobRegistry* registry, const QString& jobId, const JobDocument& doc,
                 std::unique_ptr<ProcessRunner> runner, QObject* parent = nullptr);
    ~ExportWorker();

    const QString& jobId() const { return m_jobId; }

protected:
    void run() override;

private:
    JobRegistry* m_registry;
    QString m_jobId;
    JobDocument m_doc;
    std::unique_ptr<ProcessRunner> m_runner;
};

// Tracks submitted export jobs. Status is written by each job's worker and
// read by pollers, both under the registry mutex.
class JobRegistry : public QObject {
    Q_OBJECT
public:
    using RunnerFactory = std::function<std::unique_ptr<ProcessRunner>()>;

    explicit JobRegistry(RunnerFactory runnerFactory = RunnerFactory(), QObject* parent = nullptr);
    ~JobRegistry();

    // Validates the document and starts a worker. Returns the job id, or an
    // empty string with error set when the request is rejected.
    QString submit(const JobDocument& doc, QString* error = nullptr);

    // Snapshot of a job's current state
    bool job(const QString& id, ExportJob& out) const;

    // Hands out a finished job and forgets it. False while it is still running,
    // and when called on a worker thread: jobFinished handlers that take the
    // result must be queued to the registry's thread.
    bool takeResult(const QString& id, ExportJob& out);

    QStringList jobIds() const;
    void waitForAll();

signals:
    // Emitted on the job's worker thread
    void jobFinished(const QString& id, bool success);

private:
    friend class ExportWorker;
    void updateProgress(const QString& id, int percent);
    void complete(const QString& id, bool success, const QString& message);
    bool onWorkerThread() const;

    RunnerFactory m_runnerFactory;
    mutable QMutex m_mutex;
    QHash<QString, ExportJob> m_jobs;

    mutable QMutex m_workersMutex;
    std::vector<std::unique_ptr<ExportWorker>> m_workers;
};

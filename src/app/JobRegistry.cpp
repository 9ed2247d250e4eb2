#include "JobRegistry.h"
#include "AppConstants.h"
#include "CodecPlan.h"
#include "ExportPipeline.h"
#include "JobLogger.h"
#include "ProcessRunner.h"
#include <QMutexLocker>
#include <QUuid>
#include <algorithm>

QString jobStatusName(JobStatus status) {
    switch (status) {
    case JobStatus::Running: return "running";
    case JobStatus::Done:    return "done";
    case JobStatus::Error:   return "error";
    }
    return QString();
}

ExportWorker::ExportWorker(JobRegistry* registry, const QString& jobId, const JobDocument& doc,
                           std::unique_ptr<ProcessRunner> runner, QObject* parent)
    : QThread(parent)
    , m_registry(registry)
    , m_jobId(jobId)
    , m_doc(doc)
    , m_runner(std::move(runner))
{}

ExportWorker::~ExportWorker() {
    wait();
}

void ExportWorker::run() {
    CategoryLogger logger(m_jobId.left(8));

    ResolvedCodecPlan plan = CodecPlanner::resolve(
        m_doc.target, CodecPlanner::processEncoderProbe(*m_runner, m_doc.ffmpegProgram), logger);

    ExportPipeline pipeline(m_doc.layout, m_doc.target, plan, *m_runner, logger, m_doc.ffmpegProgram);
    connect(&pipeline, &ExportPipeline::progress, &pipeline, [this](int percent) {
        m_registry->updateProgress(m_jobId, percent);
    });

    bool ok = pipeline.run(m_doc.inputs);
    m_registry->complete(m_jobId, ok, ok ? m_doc.inputs.outputPath : pipeline.errorString());
}

JobRegistry::JobRegistry(RunnerFactory runnerFactory, QObject* parent)
    : QObject(parent)
    , m_runnerFactory(std::move(runnerFactory))
{
    if (!m_runnerFactory) {
        m_runnerFactory = []() -> std::unique_ptr<ProcessRunner> {
            return std::make_unique<QtProcessRunner>();
        };
    }
}

JobRegistry::~JobRegistry() {
    waitForAll();
}

QString JobRegistry::submit(const JobDocument& doc, QString* error) {
    JobDocument accepted = doc;
    accepted.inputs = doc.inputs.trimmed();

    QString reason;
    if (!accepted.inputs.validate(&reason) ||
        !accepted.target.validate(&reason) ||
        !accepted.layout.validate(accepted.target.size(), &reason)) {
        if (error) *error = reason;
        return QString();
    }

    ExportJob job;
    job.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    job.progress = AppConstants::ProgressAccepted;
    job.outputPath = accepted.inputs.outputPath;
    {
        QMutexLocker lock(&m_mutex);
        m_jobs.insert(job.id, job);
    }

    QMutexLocker lock(&m_workersMutex);
    m_workers.push_back(std::make_unique<ExportWorker>(this, job.id, accepted, m_runnerFactory()));
    m_workers.back()->start();
    return job.id;
}

bool JobRegistry::job(const QString& id, ExportJob& out) const {
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.constFind(id);
    if (it == m_jobs.constEnd()) return false;
    out = it.value();
    return true;
}

bool JobRegistry::onWorkerThread() const {
    QMutexLocker lock(&m_workersMutex);
    QThread* current = QThread::currentThread();
    return std::any_of(m_workers.begin(), m_workers.end(),
                       [current](const std::unique_ptr<ExportWorker>& w) { return w.get() == current; });
}

bool JobRegistry::takeResult(const QString& id, ExportJob& out) {
    // A worker cannot join itself
    if (onWorkerThread()) return false;

    {
        QMutexLocker lock(&m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end() || it.value().status == JobStatus::Running) return false;
        out = it.value();
        m_jobs.erase(it);
    }

    // Joined outside the lock, the worker may still be inside a jobFinished handler
    std::unique_ptr<ExportWorker> finished;
    {
        QMutexLocker lock(&m_workersMutex);
        auto worker = std::find_if(m_workers.begin(), m_workers.end(),
                                   [&id](const std::unique_ptr<ExportWorker>& w) { return w->jobId() == id; });
        if (worker != m_workers.end()) {
            finished = std::move(*worker);
            m_workers.erase(worker);
        }
    }
    if (finished) finished->wait();
    return true;
}

QStringList JobRegistry::jobIds() const {
    QMutexLocker lock(&m_mutex);
    return m_jobs.keys();
}

void JobRegistry::waitForAll() {
    std::vector<ExportWorker*> running;
    {
        QMutexLocker lock(&m_workersMutex);
        for (auto& worker : m_workers)
            running.push_back(worker.get());
    }
    for (ExportWorker* worker : running)
        worker->wait();
}

void JobRegistry::updateProgress(const QString& id, int percent) {
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return;
    it.value().progress = std::max(it.value().progress, std::min(percent, 100));
}

void JobRegistry::complete(const QString& id, bool success, const QString& message) {
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end()) return;
        ExportJob& job = it.value();
        job.status = success ? JobStatus::Done : JobStatus::Error;
        if (success) {
            job.progress = AppConstants::ProgressComplete;
            job.outputPath = message;
        } else {
            job.message = message;
        }
    }
    emit jobFinished(id, success);
}

#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcComposer)

// Sink for pipeline diagnostics. One instance is handed to each component of
// a job so concurrent jobs never share handler state.
class JobLogger {
public:
    virtual ~JobLogger() = default;

    virtual void info(const QString& message) = 0;
    virtual void warning(const QString& message) = 0;
    virtual void error(const QString& message) = 0;
};

// Routes messages to Qt's categorized logging, prefixed with a job tag.
class CategoryLogger : public JobLogger {
public:
    explicit CategoryLogger(const QString& tag = QString());

    void info(const QString& message) override;
    void warning(const QString& message) override;
    void error(const QString& message) override;

private:
    QString decorate(const QString& message) const;

    QString m_tag;
};

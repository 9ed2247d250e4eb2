#include "JobLogger.h"

Q_LOGGING_CATEGORY(lcComposer, "meetingcomposer")

CategoryLogger::CategoryLogger(const QString& tag) : m_tag(tag) {}

void CategoryLogger::info(const QString& message) {
    qCInfo(lcComposer).noquote() << decorate(message);
}

void CategoryLogger::warning(const QString& message) {
    qCWarning(lcComposer).noquote() << decorate(message);
}

void CategoryLogger::error(const QString& message) {
    qCCritical(lcComposer).noquote() << decorate(message);
}

QString CategoryLogger::decorate(const QString& message) const {
    if (m_tag.isEmpty()) return message;
    return QString("[%1] %2").arg(m_tag, message);
}

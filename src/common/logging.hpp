#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace palchron::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking the lines of one recorded save.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

// "save:<world>@<timestamp>" for one observed save. The world is the
// directory holding Level.sav, or the save file name for any other layout.
QString saveCorrelationId(const QString &saveFilePath, const QString &timestamp);

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();
QString logsDirPath();

} // namespace palchron::logging

#define PLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::palchron::logging::logEvent(::palchron::logging::LogLevel::Debug, \
                                  ::palchron::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::palchron::logging::logEvent(::palchron::logging::LogLevel::Info, \
                                  ::palchron::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::palchron::logging::logEvent(::palchron::logging::LogLevel::Warn, \
                                  ::palchron::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::palchron::logging::logEvent(::palchron::logging::LogLevel::Error, \
                                  ::palchron::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

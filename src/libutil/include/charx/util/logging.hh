#pragma once
/**
 * @file
 *
 * The process-wide logger. Messages go through the `printMsg` family
 * of macros so that arguments are only formatted when the message is
 * going to be shown; long-running operations report progress through
 * an `Activity`.
 */

#include "charx/util/error.hh"
#include "charx/util/configuration.hh"
#include "charx/util/file-descriptor.hh"

#include <memory>
#include <variant>
#include <vector>

namespace charx {

typedef enum {
    actUnknown = 0,
    actImportAssets = 100,
    actExportArchive = 101,
    actWriteBackup = 102,
    actRestoreBackup = 103,
    actRecover = 104,
    actFileTransfer = 105,
} ActivityType;

typedef enum {
    resProgress = 100,
    resSetExpected = 101,
} ResultType;

typedef uint64_t ActivityId;

struct LoggerSettings : Config
{
    Setting<bool> showTrace{
        this,
        false,
        "show-trace",
        R"(
          Print every context trace of an error instead of only the
          outermost three.
        )"};
};

extern LoggerSettings loggerSettings;

class Logger
{
public:

    typedef std::variant<uint64_t, std::string> Field;
    typedef std::vector<Field> Fields;

    virtual ~Logger() {}

    /**
     * Flush and release the output. Nothing may be logged afterwards.
     */
    virtual void stop() {}

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg);

    virtual void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent)
    {
    }

    virtual void stopActivity(ActivityId act) {}

    virtual void result(ActivityId act, ResultType type, const Fields & fields) {}

    /**
     * Program output proper, as opposed to diagnostics.
     */
    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    void cout(const Args &... args)
    {
        writeToStdout(fmt(args...));
    }
};

/**
 * The innermost live `Activity` on this thread, or 0.
 */
ActivityId getCurActivity();

/**
 * A unit of work that reports progress. It is the current activity of
 * its thread for as long as it lives.
 */
struct Activity
{
    Logger & logger;

    const ActivityId id;

    Activity(
        Logger & logger,
        Verbosity lvl,
        ActivityType type,
        const std::string & s = "",
        const Logger::Fields & fields = {},
        ActivityId parent = getCurActivity());

    Activity(const Activity &) = delete;

    ~Activity();

    void progress(uint64_t done, uint64_t expected = 0, uint64_t running = 0, uint64_t failed = 0) const
    {
        result(resProgress, done, expected, running, failed);
    }

    void setExpected(uint64_t expected) const
    {
        result(resSetExpected, expected);
    }

    template<typename... Args>
    void result(ResultType type, const Args &... args) const
    {
        logger.result(id, type, Logger::Fields{Logger::Field(args)...});
    }

private:
    ActivityId prevAct;
};

extern std::unique_ptr<Logger> logger;

/**
 * Human-readable lines on standard error.
 */
std::unique_ptr<Logger> makeSimpleLogger();

/**
 * One JSON object per line on `fd`, for consumption by other programs.
 */
std::unique_ptr<Logger> makeJSONLogger(Descriptor fd);

/**
 * Messages above this level are suppressed.
 */
extern Verbosity verbosity;

#define logErrorInfo(level, errorInfo...)      \
    do {                                       \
        if ((level) <= charx::verbosity) {     \
            logger->logEI((level), errorInfo); \
        }                                      \
    } while (0)

#define logError(errorInfo...) logErrorInfo(lvlError, errorInfo)
#define logWarning(errorInfo...) logErrorInfo(lvlWarn, errorInfo)

/* A macro so that the arguments are only evaluated when the message
   is shown. */
#define printMsg(level, args...)               \
    do {                                       \
        auto __lvl = level;                    \
        if (__lvl <= charx::verbosity) {       \
            logger->log(__lvl, fmt(args));     \
        }                                      \
    } while (0)

#define printError(args...) printMsg(lvlError, args)
#define notice(args...) printMsg(lvlNotice, args)
#define printInfo(args...) printMsg(lvlInfo, args)
#define printTalkative(args...) printMsg(lvlTalkative, args)
#define debug(args...) printMsg(lvlDebug, args)
#define vomit(args...) printMsg(lvlVomit, args)

template<typename... Args>
void warn(const std::string & fs, const Args &... args)
{
    logger->warn(fmt(fs, args...));
}

/**
 * Write to standard error, ignoring failures so that cleanup code can
 * still log after the reader went away.
 */
void writeToStderr(std::string_view s);

} // namespace charx

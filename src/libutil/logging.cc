#include "charx/util/logging.hh"
#include "charx/util/config-global.hh"
#include "charx/util/sync.hh"
#include "charx/util/util.hh"

#include <atomic>
#include <map>

#include <nlohmann/json.hpp>

#include <unistd.h>

namespace charx {

LoggerSettings loggerSettings;

static GlobalConfig::Register rLoggerSettings(&loggerSettings);

Verbosity verbosity = lvlInfo;

static thread_local ActivityId curActivity = 0;

ActivityId getCurActivity()
{
    return curActivity;
}

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

void Logger::writeToStdout(std::string_view s)
{
    writeLine(getStandardOutput(), std::string(s));
}

void writeToStderr(std::string_view s)
{
    try {
        writeFull(getStandardError(), s);
    } catch (SysError &) {
    }
}

static uint64_t fieldInt(const Logger::Fields & fields, size_t n)
{
    if (n >= fields.size())
        return 0;
    auto i = std::get_if<uint64_t>(&fields[n]);
    return i ? *i : 0;
}

/* Messages as plain lines; progress as "text: done/expected (p%)". */
class SimpleLogger : public Logger
{
    struct ActInfo
    {
        std::string text;
        uint64_t expected = 0;
    };

    Sync<std::map<ActivityId, ActInfo>> activities;

public:

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl <= verbosity)
            writeToStderr(std::string(s) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        log(ei.level, showErrorInfo(ei, loggerSettings.showTrace));
    }

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override
    {
        activities.lock()->insert_or_assign(act, ActInfo{.text = s});
        if (!s.empty())
            log(lvl, s + "...");
    }

    void stopActivity(ActivityId act) override
    {
        activities.lock()->erase(act);
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        std::string text;
        uint64_t done = fieldInt(fields, 0), expected;

        {
            auto acts(activities.lock());
            auto i = acts->find(act);
            if (i == acts->end() || i->second.text.empty())
                return;
            if (type == resSetExpected) {
                i->second.expected = done;
                return;
            }
            text = i->second.text;
            expected = fieldInt(fields, 1);
            if (!expected)
                expected = i->second.expected;
        }

        if (expected)
            log(lvlTalkative, fmt("%s: %d/%d (%d%%)", text, done, expected, done * 100 / expected));
        else
            log(lvlTalkative, fmt("%s: %d", text, done));
    }
};

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

std::unique_ptr<Logger> logger = makeSimpleLogger();

static std::atomic<uint64_t> nextId{1};

Activity::Activity(
    Logger & logger,
    Verbosity lvl,
    ActivityType type,
    const std::string & s,
    const Logger::Fields & fields,
    ActivityId parent)
    : logger(logger)
    , id(nextId++ | (((uint64_t) getpid()) << 32))
    , prevAct(curActivity)
{
    logger.startActivity(id, lvl, type, s, fields, parent);
    curActivity = id;
}

Activity::~Activity()
{
    curActivity = prevAct;
    try {
        logger.stopActivity(id);
    } catch (Error &) {
        ignoreExceptionInDestructor();
    }
}

/* Each event is one JSON object per line. A write failure disables
   the logger rather than failing the operation being logged. */
struct JSONLogger : Logger
{
    Descriptor fd;

    Sync<bool> enabled{true};

    JSONLogger(Descriptor fd)
        : fd(fd)
    {
    }

    static void addFields(nlohmann::json & json, const Fields & fields)
    {
        if (fields.empty())
            return;
        auto & arr = json["fields"] = nlohmann::json::array();
        for (auto & f : fields)
            std::visit([&](auto & v) { arr.push_back(v); }, f);
    }

    void write(const nlohmann::json & json)
    {
        auto line = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        auto on(enabled.lock());
        if (!*on)
            return;
        try {
            writeLine(fd, line);
        } catch (SysError & e) {
            *on = false;
            writeToStderr(fmt("warning: disabling JSON logger: %s\n", e.message()));
        }
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        write({{"action", "msg"}, {"level", lvl}, {"msg", s}});
    }

    void logEI(const ErrorInfo & ei) override
    {
        nlohmann::json json{
            {"action", "msg"},
            {"level", ei.level},
            {"msg", showErrorInfo(ei, loggerSettings.showTrace)},
            {"raw_msg", ei.msg.str()},
        };
        if (loggerSettings.showTrace && !ei.traces.empty())
            json["trace"] = ei.traces;
        write(json);
    }

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override
    {
        nlohmann::json json{
            {"action", "start"},
            {"id", act},
            {"level", lvl},
            {"type", type},
            {"text", s},
            {"parent", parent},
        };
        addFields(json, fields);
        write(json);
    }

    void stopActivity(ActivityId act) override
    {
        write({{"action", "stop"}, {"id", act}});
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        nlohmann::json json{{"action", "result"}, {"id", act}, {"type", type}};
        addFields(json, fields);
        write(json);
    }
};

std::unique_ptr<Logger> makeJSONLogger(Descriptor fd)
{
    return std::make_unique<JSONLogger>(fd);
}

} // namespace charx

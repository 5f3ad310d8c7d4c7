#include "charx/bundle/archive-reader.hh"
#include "charx/bundle/bundle-settings.hh"
#include "charx/bundle/chat-zip-export.hh"
#include "charx/bundle/chunked-backup.hh"
#include "charx/bundle/recovery.hh"
#include "charx/bundle/save-slot.hh"
#include "charx/store/asset-format.hh"
#include "charx/store/local-asset-store.hh"
#include "charx/store/remote-assets.hh"
#include "charx/util/ansicolor.hh"
#include "charx/util/config-global.hh"
#include "charx/util/file-system.hh"
#include "charx/util/util.hh"

#include <fcntl.h>
#include <unistd.h>

#include <iostream>

namespace charx {

struct Exit : public std::exception
{
    int status;

    Exit(int status)
        : status(status)
    {
    }
};

typedef void (*Operation)(Strings opFlags, Strings opArgs);

static std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

static void showHelp()
{
    logger->cout(
        "Usage: charx [OPTIONS] COMMAND [ARGS...]\n"
        "\n"
        "Commands:\n"
        "  export-chat PAYLOAD OUTPUT [INLAY-ID...]  write a chat archive\n"
        "  import ARCHIVE                           import a character archive\n"
        "  backup OUTPUT                            write a chunked backup\n"
        "  restore BACKUP                           restore a chunked backup\n"
        "  recover                                  load the saved state with fallback\n"
        "  show-config                              print the effective settings\n"
        "\n"
        "Options:\n"
        "  --option NAME VALUE       set a setting\n"
        "  --log-format internal-json  log as JSON records\n"
        "  -v, --verbose             increase verbosity\n"
        "  --quiet                   decrease verbosity\n");
    throw Exit(0);
}

static Path dataDir()
{
    return getDataDir();
}

static LocalAssetStore openAssetStore()
{
    return LocalAssetStore(dataDir());
}

static SaveSlot openSaveSlot()
{
    return SaveSlot(dataDir() + "/database");
}

static Strings takeFlagArgs(Strings & opFlags, const std::string & flag)
{
    Strings res;
    for (auto i = opFlags.begin(); i != opFlags.end();) {
        if (*i == flag) {
            i = opFlags.erase(i);
            if (i == opFlags.end())
                throw UsageError("'%1%' requires an argument", flag);
            res.push_back(*i);
            i = opFlags.erase(i);
        } else
            ++i;
    }
    return res;
}

static bool takeFlag(Strings & opFlags, const std::string & flag)
{
    auto n = opFlags.size();
    opFlags.remove(flag);
    return opFlags.size() != n;
}

static void checkNoFlags(const Strings & opFlags)
{
    for (auto & i : opFlags)
        throw UsageError("unknown flag '%1%'", i);
}

/* Inlays are looked up in the asset store as `assets/<id>.<ext>`. */
static InlayLookup storeInlayLookup(AssetStore & store)
{
    return [&store, keys = store.keys()](const std::string & id) -> std::optional<InlayAsset> {
        auto prefix = "assets/" + id + ".";
        for (auto & key : keys)
            if (hasPrefix(key, prefix)) {
                auto ext = extensionOf(key);
                return InlayAsset{.data = store.load(key), .ext = ext, .kind = assetKindFromExtension(ext)};
            }
        return std::nullopt;
    };
}

static void opExportChat(Strings opFlags, Strings opArgs)
{
    checkNoFlags(opFlags);
    if (opArgs.size() < 2)
        throw UsageError("'export-chat' requires a payload file and an output path");

    auto payloadPath = opArgs.front();
    opArgs.pop_front();
    auto output = opArgs.front();
    opArgs.pop_front();

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(readFile(payloadPath));
    } catch (nlohmann::json::exception & e) {
        throw UsageError("'%s' is not valid JSON: %s", payloadPath, e.what());
    }

    auto store = openAssetStore();
    FileEntrySink sink(output);
    auto res = exportChatZip(sink, baseNameOf(output), payload, opArgs, storeInlayLookup(store));

    for (auto & id : res.missingInlays)
        printError("missing inlay: %s", id);
    notice("wrote '%s' with %d inlays", output, res.manifest.assets.size());
}

static void opImport(Strings opFlags, Strings opArgs)
{
    ArchiveReader::Options options;
    options.hashOnly = takeFlag(opFlags, "--hash-only");
    options.requireManifest = takeFlag(opFlags, "--require-manifest");
    for (auto & entry : takeFlagArgs(opFlags, "--metadata-entry"))
        options.metadataEntry = entry;
    checkNoFlags(opFlags);
    if (opArgs.size() != 1)
        throw UsageError("'import' requires exactly one archive");

    auto path = opArgs.front();
    auto store = openAssetStore();

    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening archive '%1%'", path);

    if (!bundleSettings.assetHubUrl.get().empty() && !options.hashOnly) {
        FdSource archive(fd.get());
        auto remote = checkRemoteAssets(*getFileTransfer(), bundleSettings.assetHubUrl.get(), archive);
        if (remote.exists) {
            printInfo("the asset hub already has archive %s; not storing its assets", remote.hash);
            options.hashOnly = true;
        } else
            options.hashSignal = remote.hash;
        if (lseek(fd.get(), 0, SEEK_SET) == -1)
            throw SysError("rewinding archive '%1%'", path);
    }

    ArchiveReader reader(store, options);
    reader.parse(fd.get());

    nlohmann::json res;
    if (reader.cardData()) {
        try {
            res["card"] = nlohmann::json::parse(*reader.cardData());
        } catch (nlohmann::json::exception & e) {
            throw StructuralError("'%s' is not valid JSON: %s", options.metadataEntry, e.what());
        }
    }
    if (reader.moduleData())
        res["moduleSize"] = reader.moduleData()->size();
    res["excludedFiles"] = reader.excludedFiles();

    unsigned int status = 0;
    try {
        reader.done().get();
    } catch (AssetPipelineFailure & e) {
        logError(e.info());
        nlohmann::json failed;
        for (auto & [name, msg] : e.failures)
            failed[name] = msg;
        res["failedAssets"] = std::move(failed);
        status = 1;
    }

    res["assets"] = reader.assets();
    logger->cout("%s", res.dump(2));

    if (status)
        throw Exit(status);
}

static void opBackup(Strings opFlags, Strings opArgs)
{
    auto partial = takeFlagArgs(opFlags, "--critical");
    bool isPartial = takeFlag(opFlags, "--partial");
    checkNoFlags(opFlags);
    if (opArgs.size() != 1)
        throw UsageError("'backup' requires an output path");

    auto store = openAssetStore();
    auto slot = openSaveSlot();
    auto state = LegacySaveContainer(slot.primaryPath()).load();

    FileEntrySink sink(opArgs.front());
    auto res = isPartial ? writePartialBackup(sink, store, state, StringSet(partial.begin(), partial.end()))
                         : writeFullBackup(sink, store, state);

    for (auto & key : res.missingAssets)
        printError("skipped missing asset '%s'", key);
    notice("wrote backup '%s' with %d assets", opArgs.front(), res.assetsWritten);
}

static void opRestore(Strings opFlags, Strings opArgs)
{
    checkNoFlags(opFlags);
    if (opArgs.size() != 1)
        throw UsageError("'restore' requires a backup file");

    auto path = opArgs.front();
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening backup '%1%'", path);
    auto store = openAssetStore();
    auto slot = openSaveSlot();
    FdSource source(fd.get());

    auto res = slot.restoreFrom(source, store, []() { notice("restart the application to load the restored state"); });

    for (auto & name : res.failedAssets)
        printError("could not restore asset '%s'", name);
}

static void opRecover(Strings opFlags, Strings opArgs)
{
    auto remotes = takeFlagArgs(opFlags, "--remote");
    bool accountSync = takeFlag(opFlags, "--account-sync");
    checkNoFlags(opFlags);
    if (!opArgs.empty())
        throw UsageError("'recover' takes no arguments");

    auto slot = openSaveSlot();

    RecoveryPlan plan{
        .primary = slot.primaryContainer(),
        .backups = slot.backupContainers(),
        .remote = remotes.empty() ? nullptr : std::make_shared<RemoteStateContainer>(getFileTransfer(), remotes.back()),
        .accountSyncAuthoritative = accountSync,
    };

    auto res = recover(std::move(plan));

    if (res.tier != RecoveryTier::Primary)
        slot.writePrimary(encodeState(res.state));

    nlohmann::json attempts = nlohmann::json::array();
    for (auto & a : res.attempts)
        attempts.push_back({
            {"tier", std::string(showRecoveryTier(a.tier))},
            {"source", a.source},
            {"error", a.error ? nlohmann::json(*a.error) : nlohmann::json()},
        });

    logger->cout(
        "%s",
        nlohmann::json{
            {"tier", std::string(showRecoveryTier(res.tier))},
            {"source", res.source},
            {"degraded", res.degraded},
            {"attempts", std::move(attempts)},
        }
            .dump(2));
}

static void opShowConfig(Strings opFlags, Strings opArgs)
{
    bool json = takeFlag(opFlags, "--json");
    checkNoFlags(opFlags);
    if (json)
        logger->cout("%s", globalConfig.toJSON().dump(2));
    else
        logger->cout("%s", globalConfig.toKeyValue());
}

static int main_charx(int argc, char ** argv)
{
    Strings args;
    for (int i = 1; i < argc; ++i)
        args.push_back(argv[i]);

    loadConfFile();

    Operation op = nullptr;
    Strings opFlags, opArgs;

    for (auto arg = args.begin(); arg != args.end(); ++arg) {
        if (*arg == "--help" || *arg == "-h")
            showHelp();
        else if (*arg == "--verbose" || *arg == "-v")
            verbosity = (Verbosity) std::min<int>(verbosity + 1, lvlVomit);
        else if (*arg == "--quiet")
            verbosity = verbosity > lvlError ? (Verbosity) (verbosity - 1) : lvlError;
        else if (*arg == "--option") {
            auto name = getArg(*arg, arg, args.end());
            auto value = getArg(*arg, arg, args.end());
            if (!globalConfig.set(name, value))
                throw UsageError("unknown setting '%s'", name);
        } else if (*arg == "--log-format") {
            auto format = getArg(*arg, arg, args.end());
            if (format == "internal-json")
                logger = makeJSONLogger(getStandardError());
            else if (format != "raw")
                throw UsageError("unknown log format '%s'", format);
        } else if (!op) {
            if (*arg == "export-chat")
                op = opExportChat;
            else if (*arg == "import")
                op = opImport;
            else if (*arg == "backup")
                op = opBackup;
            else if (*arg == "restore")
                op = opRestore;
            else if (*arg == "recover")
                op = opRecover;
            else if (*arg == "show-config")
                op = opShowConfig;
            else
                throw UsageError("unknown command '%s'", *arg);
        } else if (*arg != "" && arg->at(0) == '-') {
            opFlags.push_back(*arg);
            if (*arg == "--critical" || *arg == "--remote" || *arg == "--metadata-entry")
                opFlags.push_back(getArg(*arg, arg, args.end()));
        } else
            opArgs.push_back(*arg);
    }

    if (!op)
        throw UsageError("no command specified");

    op(opFlags, opArgs);

    logger->stop();

    return 0;
}

static int handleExceptions(const std::string & programName, std::function<int()> fun)
{
    ErrorInfo::programName = std::string(baseNameOf(programName));

    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        return fun();
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1% --help' for more information.", programName);
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc & e) {
        printError(error + "out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(error + e.what());
        return 1;
    }
}

} // namespace charx

int main(int argc, char ** argv)
{
    return charx::handleExceptions(argv[0], [&]() { return charx::main_charx(argc, argv); });
}

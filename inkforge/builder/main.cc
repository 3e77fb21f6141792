#include "inkforge/libbuilder/build-settings.hh"
#include "inkforge/libbuilder/orchestrator.hh"
#include "inkforge/libbuilder/sandbox.hh"
#include "inkforge/libbuilder/spool.hh"
#include "inkforge/libbuilder/stage.hh"
#include "inkforge/libbuilder/volume.hh"
#include "inkforge/libmain/shared.hh"
#include "inkforge/libutil/async.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/signals.hh"

#include <cstdlib>
#include <iostream>

using namespace inkforge;

static void showHelp(const std::string & programName)
{
    std::cout << fmt(
        "Usage: %1% [OPTION]... serve\n"
        "\n"
        "Build smart contracts submitted through the spool directory.\n"
        "\n"
        "Options:\n"
        "  --config PATH        read settings from PATH instead of $INKFORGE_CONFIG\n"
        "                       or /etc/inkforge/builder.conf\n"
        "  --option NAME VALUE  set a single setting\n"
        "  -v, --verbose        log more, may be repeated\n"
        "  --quiet              log less, may be repeated\n"
        "  --help               show this help\n"
        "  --version            show the version\n",
        programName
    );
}

static void loadSettings(
    const std::optional<Path> & configFile,
    const std::vector<std::pair<std::string, std::string>> & overrides
)
{
    if (configFile) {
        if (!pathExists(*configFile)) {
            throw UsageError("configuration file '%s' does not exist", *configFile);
        }
        builderSettings.applyConfigFile(*configFile);
    } else if (auto env = std::getenv("INKFORGE_CONFIG"); env && *env) {
        builderSettings.applyConfigFile(env);
    } else if (pathExists("/etc/inkforge/builder.conf")) {
        builderSettings.applyConfigFile("/etc/inkforge/builder.conf");
    }

    for (auto & [name, value] : overrides) {
        if (!builderSettings.set(name, value)) {
            throw UsageError("unknown setting '%s'", name);
        }
    }

    builderSettings.warnUnknownSettings();
    builderSettings.validate();
    debug("effective configuration: %s", builderSettings.toJSON().dump());
}

static std::unique_ptr<VolumeManager> makeVolumeManager()
{
    switch (builderSettings.volumeBackend.get()) {
    case VolumeBackend::Loop:
        return std::make_unique<LoopVolumeManager>(builderSettings.imagesPath.get());
    case VolumeBackend::Directory:
        return std::make_unique<DirectoryVolumeManager>(builderSettings.imagesPath.get());
    }
    throw Error("unknown volume backend");
}

static std::unique_ptr<SandboxRuntime> makeSandboxRuntime()
{
    switch (builderSettings.sandboxRuntime.get()) {
    case SandboxRuntimeKind::Linux:
        return std::make_unique<LinuxSandboxRuntime>(
            builderSettings.cgroupParent.get(),
            builderSettings.stateDir.get(),
            builderSettings.sandboxPath.get()
        );
    case SandboxRuntimeKind::Process:
        return std::make_unique<ProcessSandboxRuntime>(builderSettings.sandboxPath.get());
    }
    throw Error("unknown sandbox runtime");
}

static int serve()
{
    AsyncIoRoot aio;
    auto & timer = aio.kj.provider->getTimer();

    auto volumes = makeVolumeManager();
    try {
        aio.blockOn(volumes->checkBackingStore());
    } catch (Error & e) {
        logError(e.info());
        printError("volumes cannot be provisioned on this host, refusing to start");
        return 1;
    }

    auto runtime = makeSandboxRuntime();

    Orchestrator orchestrator(
        builderSettings, *volumes, *runtime, defaultPipeline(builderSettings), timer
    );
    aio.blockOn(orchestrator.recover());

    Spool spool(builderSettings.spoolDir.get(), orchestrator, builderSettings);
    spool.resume();

    notice(
        "inkforge builder serving '%s' with %d worker slots",
        builderSettings.spoolDir.get(),
        orchestrator.slots().capacity()
    );

    try {
        aio.blockOn(makeInterruptible(spool.run(timer)));
    } catch (Interrupted &) {
        // acknowledged here so the teardown below can still block
        threadInterruptSeq = _interruptSequence.load();
    }

    notice("shutting down, cancelling %d active sessions", orchestrator.activeSessions().size());
    aio.blockOn(orchestrator.shutdown());
    return 0;
}

static int main_(int argc, char ** argv)
{
    std::string programName(baseNameOf(argv[0]));
    Strings args(argv + 1, argv + argc);

    std::optional<Path> configFile;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::optional<std::string> command;

    for (auto i = args.begin(); i != args.end(); ++i) {
        auto & arg = *i;
        if (arg == "--help") {
            showHelp(programName);
            return 0;
        } else if (arg == "--version") {
            printVersion(programName);
            return 0;
        } else if (arg == "--config") {
            configFile = getArg(arg, i, args.end());
        } else if (arg == "--option") {
            auto name = getArg(arg, i, args.end());
            auto value = getArg(arg, i, args.end());
            overrides.emplace_back(name, value);
        } else if (arg == "-v" || arg == "--verbose") {
            verbosity = verbosityFromIntClamped(int(verbosity) + 1);
        } else if (arg == "--quiet") {
            verbosity = verbosityFromIntClamped(int(verbosity) - 1);
        } else if (arg.starts_with("-")) {
            throw UsageError("unrecognised flag '%1%'", arg);
        } else if (!command) {
            command = arg;
        } else {
            throw UsageError("unexpected argument '%1%'", arg);
        }
    }

    if (!command) {
        throw UsageError("no command given");
    }
    if (*command != "serve") {
        throw UsageError("unknown command '%1%'", *command);
    }

    loadSettings(configFile, overrides);
    return serve();
}

int main(int argc, char ** argv)
{
    return handleExceptions(argv[0], [&]() {
        initInkforge();
        return main_(argc, argv);
    });
}

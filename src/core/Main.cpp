/*
  ==============================================================================
    Main.cpp - Application Entry Point
  ==============================================================================
*/

#include <JuceHeader.h>
#include <iostream>
#include "RenderJob.h"
#include "RenderOptions.h"
#include "../rendering/FFmpegExecutor.h"
#include "../template/VariableResolver.h"
#include "../timing/MediaTimingDistributor.h"

namespace
{
    constexpr int usageErrorCode = 2;
    constexpr int renderErrorCode = 1;

    /** Writes to the session log file and, in verbose mode, to stdout as well. */
    class ConsoleLogger : public juce::Logger
    {
    public:
        ConsoleLogger(const juce::File& logFile, bool echo)
            : fileLogger(logFile, "Storyreel Session Log", 0),
              echoToConsole(echo)
        {
        }

        void logMessage(const juce::String& message) override
        {
            fileLogger.logMessage(message);

            if (echoToConsole)
            {
                juce::ScopedLock lock(consoleLock);
                std::cout << message << std::endl;
            }
        }

    private:
        juce::FileLogger fileLogger;
        bool echoToConsole;
        juce::CriticalSection consoleLock;
    };

    std::unique_ptr<ConsoleLogger> logger;

    void startLogging(const RenderOptions& options, bool verbose)
    {
        juce::File logsDirectory = options.getLogRoot();
        if (!logsDirectory.isDirectory() && !logsDirectory.createDirectory())
            logsDirectory = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();

        juce::String sessionStamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
        juce::File logFile = logsDirectory.getChildFile("Storyreel_" + sessionStamp + ".log");

        logger = std::make_unique<ConsoleLogger>(logFile, verbose);
        juce::Logger::setCurrentLogger(logger.get());

        juce::Logger::writeToLog("----------------------------------------------------");
        juce::Logger::writeToLog("Storyreel started: " + juce::Time::getCurrentTime().toString(true, true));
        juce::Logger::writeToLog("Version: " + juce::String(ProjectInfo::versionString));
        juce::Logger::writeToLog("----------------------------------------------------");
    }

    void stopLogging()
    {
        if (logger == nullptr)
            return;

        juce::Logger::writeToLog("----------------------------------------------------");
        juce::Logger::writeToLog("Storyreel shutting down: " + juce::Time::getCurrentTime().toString(true, true));
        juce::Logger::writeToLog("----------------------------------------------------");

        juce::Logger::setCurrentLogger(nullptr);
        logger = nullptr;
    }

    //==============================================================================
    juce::var loadJsonFile(const juce::ArgumentList& args, const juce::String& option)
    {
        const auto file = args.getExistingFileForOption(option);

        juce::var parsed;
        const auto result = juce::JSON::parse(file.loadFileAsString(), parsed);
        if (result.failed())
            juce::ConsoleApplication::fail("Invalid JSON in " + file.getFullPathName() + ": "
                                           + result.getErrorMessage(), usageErrorCode);

        return parsed;
    }

    juce::var loadOptionalJson(const juce::ArgumentList& args, const juce::String& option)
    {
        return args.containsOption(option) ? loadJsonFile(args, option) : juce::var();
    }

    RenderOptions loadOptions(const juce::ArgumentList& args)
    {
        RenderOptions options;

        if (args.containsOption("--config"))
        {
            const auto result = RenderOptions::loadFromFile(args.getExistingFileForOption("--config"), options);
            if (result.failed())
                juce::ConsoleApplication::fail(result.getErrorMessage(), usageErrorCode);
        }

        options.applyEnvironment();
        return options;
    }

    RenderTypes::RenderRequest buildRequest(const juce::ArgumentList& args)
    {
        RenderTypes::RenderRequest request;

        request.templateDocument = loadJsonFile(args, "--template");
        request.variables = loadOptionalJson(args, "--variables");
        request.overrides = loadOptionalJson(args, "--overrides");

        if (args.containsOption("--sections"))
            request.sections = MediaTimingDistributor::sectionsFromVar(loadJsonFile(args, "--sections"));

        if (args.containsOption("--assets"))
            request.assets = MediaTimingDistributor::assetsFromVar(loadJsonFile(args, "--assets"));

        request.mapping = loadOptionalJson(args, "--mapping");

        const auto mode = args.getValueForOption("--mode");
        if (mode.isNotEmpty())
            request.mode = RenderTypes::distributionModeFromString(mode);
        else if (request.mapping.isObject())
            request.mode = RenderTypes::DistributionMode::Manual;

        request.narrationUrl = args.getValueForOption("--narration");

        if (args.containsOption("--background"))
            request.backgroundClip = args.getExistingFileForOption("--background");

        const auto output = args.getValueForOption("--output");
        if (output.isEmpty())
            juce::ConsoleApplication::fail("Missing --output", usageErrorCode);

        request.outputFile = juce::File::getCurrentWorkingDirectory().getChildFile(output);
        return request;
    }

    //==============================================================================
    void relaunchDetached(const juce::ArgumentList& args, const juce::File& statusFile)
    {
        juce::StringArray command { juce::File::getSpecialLocation(juce::File::currentExecutableFile).getFullPathName() };

        for (int i = 0; i < args.size(); ++i)
            if (args[i].text != "--detach")
                command.add(args[i].text);

        // Callers may poll the record before the child has started
        auto record = juce::var(new juce::DynamicObject());
        record.getDynamicObject()->setProperty("status", "queued");
        record.getDynamicObject()->setProperty("progress", 0);
        record.getDynamicObject()->setProperty("step", "Queued");

        statusFile.getParentDirectory().createDirectory();
        if (!statusFile.replaceWithText(juce::JSON::toString(record)))
            juce::ConsoleApplication::fail("Cannot write status file " + statusFile.getFullPathName(), renderErrorCode);

        juce::ChildProcess process;
        if (!process.start(command, 0))
            juce::ConsoleApplication::fail("Failed to start the background render", renderErrorCode);

        juce::Logger::writeToLog("Render detached, status in " + statusFile.getFullPathName());
        std::cout << statusFile.getFullPathName() << std::endl;
    }

    void runRender(const juce::ArgumentList& args)
    {
        const bool detach = args.containsOption("--detach");
        const auto statusOption = args.getValueForOption("--status-file");

        if (detach && statusOption.isEmpty())
            juce::ConsoleApplication::fail("--detach needs --status-file", usageErrorCode);

        const auto statusFile = statusOption.isNotEmpty()
            ? juce::File::getCurrentWorkingDirectory().getChildFile(statusOption)
            : juce::File();

        auto options = loadOptions(args);
        auto request = buildRequest(args);

        startLogging(options, args.containsOption("--verbose|-v"));

        if (detach)
        {
            relaunchDetached(args, statusFile);
            stopLogging();
            return;
        }

        RenderJob job(request, options, statusFile);
        job.setProgressCallback([](int percent, const juce::String& step)
        {
            juce::Logger::writeToLog("Progress " + juce::String(percent) + "% - " + step);
        });

        if (!job.start())
            juce::ConsoleApplication::fail("Could not start the render thread", renderErrorCode);

        job.waitForCompletion();

        const auto result = job.getResult();
        std::cout << juce::JSON::toString(result.toVar()) << std::endl;

        stopLogging();

        if (!result.success)
            juce::ConsoleApplication::fail(result.message, renderErrorCode);
    }

    void listPlaceholders(const juce::ArgumentList& args)
    {
        const auto overrides = loadOptionalJson(args, "--overrides");
        const auto variables = loadOptionalJson(args, "--variables");

        auto document = loadJsonFile(args, "--template");
        if (overrides.isObject())
            document = VariableResolver::mergeOverrides(document, overrides);

        juce::Array<juce::var> placeholders;
        for (const auto& name : VariableResolver::extractPlaceholders(document))
            placeholders.add(name);

        juce::Array<juce::var> missing;
        for (const auto& name : VariableResolver::findMissingRequired(document, variables))
            missing.add(name);

        auto* output = new juce::DynamicObject();
        output->setProperty("placeholders", placeholders);
        output->setProperty("missing_required", missing);

        std::cout << juce::JSON::toString(juce::var(output)) << std::endl;
    }

    void probeTools(const juce::ArgumentList& args)
    {
        const auto options = loadOptions(args);

        FFmpegExecutor ffmpeg;
        ffmpeg.setExecutablePaths(options.ffmpegPath, options.ffprobePath);

        const bool available = ffmpeg.checkFFmpegAvailability();

        auto* output = new juce::DynamicObject();
        output->setProperty("ffmpeg", ffmpeg.getFFmpegPath());
        output->setProperty("ffprobe", ffmpeg.getFFprobePath());
        output->setProperty("ffmpeg_available", available);
        output->setProperty("nvenc_available", available && ffmpeg.isNVENCAvailable());

        std::cout << juce::JSON::toString(juce::var(output)) << std::endl;

        if (!available)
            juce::ConsoleApplication::fail("ffmpeg was not found", renderErrorCode);
    }
}

//==============================================================================
int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", "Storyreel " + juce::String(ProjectInfo::versionString)
                                    + " - template driven video rendering", true);
    app.addVersionCommand("--version", "Storyreel " + juce::String(ProjectInfo::versionString));

    app.addCommand({ "render",
                     "render --template T.json --output OUT [--variables V.json] [--overrides O.json] [--sections S.json] "
                     "[--assets A.json] [--mapping M.json] [--mode auto|manual] [--narration URL] "
                     "[--background CLIP] [--config C.json] [--status-file J.json] [--detach] [--verbose]",
                     "Renders a template to a video or audio file",
                     "Writes the result as JSON to stdout. With --detach the render continues in a "
                     "background process and only the status file reports on it.",
                     runRender });

    app.addCommand({ "placeholders",
                     "placeholders --template T.json [--variables V.json] [--overrides O.json]",
                     "Lists the template's placeholders and any required variables without a value",
                     {},
                     listPlaceholders });

    app.addCommand({ "probe",
                     "probe [--config C.json]",
                     "Reports whether ffmpeg and the NVENC encoder are available",
                     {},
                     probeTools });

    const int exitCode = app.findAndRunCommand(argc, argv);
    stopLogging();
    return exitCode;
}

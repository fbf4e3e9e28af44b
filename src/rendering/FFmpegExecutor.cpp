//==============================================================================
/**
 * @file FFmpegExecutor.cpp
 *
 * Runs FFmpeg commands as external processes. Progress is derived from the
 * time= field FFmpeg prints on stderr, mapped against the expected output
 * duration supplied by the caller.
 */

#include "FFmpegExecutor.h"

namespace
{
    constexpr int errorTailLines = 20;

    // FFmpeg output may contain non-ASCII file names, so always decode as UTF-8
    juce::String decodeOutput(const char* buffer, int length)
    {
        return juce::String::fromUTF8(buffer, length);
    }

    juce::String locateExecutable(const juce::String& overridePath, const char* environmentVariable,
                                  const juce::String& name)
    {
        if (overridePath.isNotEmpty())
            return overridePath;

        const auto fromEnvironment = juce::SystemStats::getEnvironmentVariable(environmentVariable, {});
        if (fromEnvironment.isNotEmpty())
            return fromEnvironment;

       #if JUCE_WINDOWS
        const auto fileName = name + ".exe";
       #else
        const auto fileName = name;
       #endif

        // Look next to the executable first, then fall back to the PATH
        const auto local = juce::File::getSpecialLocation(juce::File::currentExecutableFile)
                               .getParentDirectory().getChildFile(fileName);
        if (local.existsAsFile())
            return local.getFullPathName();

        return fileName;
    }
}

//==============================================================================
FFmpegExecutor::FFmpegExecutor()
{
}

FFmpegExecutor::~FFmpegExecutor()
{
}

void FFmpegExecutor::setProgressCallback(std::function<void(double)> callback)
{
    progressCallback = callback;
}

void FFmpegExecutor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void FFmpegExecutor::setExecutablePaths(const juce::String& ffmpeg, const juce::String& ffprobe)
{
    ffmpegOverride = ffmpeg.trim();
    ffprobeOverride = ffprobe.trim();
    nvencState = -1;
}

void FFmpegExecutor::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

//==============================================================================
void FFmpegExecutor::setSessionLogDirectory(const juce::File& directory)
{
    juce::ScopedLock sl(logDirectoryLock);

    sessionLoggingEnabled = false;
    sessionLogDirectory = juce::File();
    sessionAggregateLogFile = juce::File();
    sessionCommandIndex = 0;

    if (directory == juce::File())
        return;

    if (!directory.isDirectory() && !directory.createDirectory().wasOk())
        return;

    sessionLogDirectory = directory;
    sessionAggregateLogFile = sessionLogDirectory.getChildFile("ffmpeg.log");
    if (sessionAggregateLogFile.existsAsFile())
        sessionAggregateLogFile.deleteFile();

    sessionLoggingEnabled = true;
}

juce::File FFmpegExecutor::getNextCommandLogFile(int& outIndex)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
    {
        outIndex = -1;
        return juce::File();
    }

    ++sessionCommandIndex;
    outIndex = sessionCommandIndex;
    return sessionLogDirectory.getChildFile(juce::String::formatted("ffmpeg_%03d.log", sessionCommandIndex));
}

void FFmpegExecutor::writeToAggregateLog(const juce::String& message)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
        return;

    juce::FileOutputStream stream(sessionAggregateLogFile, 1024);
    if (stream.openedOk())
        stream.writeText(message + "\n", false, false, nullptr);
}

//==============================================================================
bool FFmpegExecutor::execute(const juce::StringArray& arguments, double expectedDuration)
{
    juce::StringArray command;
    command.add(getFFmpegPath());
    command.addArray(arguments);

    const auto commandLine = describeCommand(command);
    const juce::String startTimeString = juce::Time::getCurrentTime().toString(true, true);

    int commandLogIndex = -1;
    const auto commandLogFile = getNextCommandLogFile(commandLogIndex);
    const auto commandIndexLabel = commandLogIndex > 0 ? juce::String::formatted("#%03d", commandLogIndex)
                                                       : juce::String("#---");

    std::unique_ptr<juce::FileOutputStream> commandLog;
    if (commandLogFile != juce::File())
    {
        auto stream = std::make_unique<juce::FileOutputStream>(commandLogFile);
        if (stream->openedOk())
        {
            stream->writeText("Started: " + startTimeString + "\n", false, false, nullptr);
            stream->writeText("Command: " + commandLine + "\n", false, false, nullptr);
            stream->writeText("------------------------------------------------------------\n", false, false, nullptr);
            stream->flush();
            commandLog = std::move(stream);
        }
    }

    writeToAggregateLog(commandIndexLabel + " [" + startTimeString + "] START " + commandLine);

    {
        juce::ScopedLock sl(processLock);
        activeProcess = std::make_unique<juce::ChildProcess>();

        if (!activeProcess->start(command))
        {
            lastErrorOutput = "Failed to start " + command[0];
            log("ERROR: " + lastErrorOutput);
            if (commandLog != nullptr)
                commandLog->writeText("Failed to start FFmpeg process\n", false, false, nullptr);
            writeToAggregateLog(commandIndexLabel + " [" + juce::Time::getCurrentTime().toString(true, true) + "] START_FAILED");
            activeProcess.reset();
            return false;
        }
    }

    if (progressCallback)
        progressCallback(0.0);

    juce::StringArray recentLines;
    juce::String pending;
    double lastReportedSeconds = 0.0;

    auto consume = [&](const juce::String& chunk)
    {
        if (commandLog != nullptr)
            commandLog->writeText(chunk.replace("\r", "\n"), false, false, nullptr);

        pending += chunk.replace("\r", "\n");
        const int lastBreak = pending.lastIndexOfChar('\n');
        if (lastBreak < 0)
            return;

        juce::StringArray lines;
        lines.addLines(pending.substring(0, lastBreak));
        pending = pending.substring(lastBreak + 1);

        for (const auto& line : lines)
        {
            if (line.trim().isEmpty())
                continue;

            recentLines.add(line.trim());
            if (recentLines.size() > errorTailLines)
                recentLines.remove(0);

            const double seconds = parseProgressSeconds(line);
            if (seconds > 0.0 && expectedDuration > 0.0 && progressCallback
                && seconds - lastReportedSeconds >= 1.0)
            {
                progressCallback(juce::jmin(0.99, seconds / expectedDuration));
                lastReportedSeconds = seconds;
            }
        }
    };

    char buffer[4096];
    for (;;)
    {
        const int bytesRead = activeProcess->readProcessOutput(buffer, (int) sizeof(buffer));
        if (bytesRead > 0)
        {
            consume(decodeOutput(buffer, bytesRead));
            continue;
        }

        if (!activeProcess->isRunning())
            break;

        juce::Thread::sleep(20);
    }

    const auto remainder = pending;
    pending.clear();
    consume(remainder + "\n");

    int exitCode = 0;
    {
        juce::ScopedLock sl(processLock);
        exitCode = (int) activeProcess->getExitCode();
        activeProcess.reset();
    }

    const juce::String finishTimeString = juce::Time::getCurrentTime().toString(true, true);
    if (commandLog != nullptr)
    {
        commandLog->writeText("\n------------------------------------------------------------\n", false, false, nullptr);
        commandLog->writeText("Finished: " + finishTimeString + "\n", false, false, nullptr);
        commandLog->writeText("Exit code: " + juce::String(exitCode) + "\n", false, false, nullptr);
        commandLog->flush();
    }
    writeToAggregateLog(commandIndexLabel + " [" + finishTimeString + "] END exitCode=" + juce::String(exitCode));

    if (exitCode != 0)
    {
        lastErrorOutput = recentLines.joinIntoString("\n");
        log("FFmpeg error (exit code: " + juce::String(exitCode) + ")");
        if (recentLines.size() > 0)
            log("FFmpeg: " + recentLines[recentLines.size() - 1]);
        return false;
    }

    lastErrorOutput.clear();
    if (progressCallback)
        progressCallback(1.0);

    return true;
}

juce::String FFmpegExecutor::getLastErrorOutput() const
{
    return lastErrorOutput;
}

//==============================================================================
juce::String FFmpegExecutor::runAndCapture(const juce::StringArray& command, int timeoutMs)
{
    juce::ChildProcess process;

    if (!process.start(command))
        return {};

    const auto output = process.readAllProcessOutput();
    if (!process.waitForProcessToFinish(timeoutMs))
        process.kill();

    return output;
}

//==============================================================================
juce::String FFmpegExecutor::getFFmpegPath() const
{
    return locateExecutable(ffmpegOverride, "STORYREEL_FFMPEG", "ffmpeg");
}

juce::String FFmpegExecutor::getFFprobePath() const
{
    return locateExecutable(ffprobeOverride, "STORYREEL_FFPROBE", "ffprobe");
}

bool FFmpegExecutor::checkFFmpegAvailability()
{
    juce::ChildProcess process;

    if (!process.start(juce::StringArray { getFFmpegPath(), "-version" }))
        return false;

    process.readAllProcessOutput();
    if (!process.waitForProcessToFinish(5000))
    {
        process.kill();
        return false;
    }

    return process.getExitCode() == 0;
}

bool FFmpegExecutor::isNVENCAvailable()
{
    if (nvencState < 0)
    {
        const auto output = runAndCapture({ getFFmpegPath(), "-hide_banner", "-encoders" }, 5000);
        nvencState = output.contains("h264_nvenc") ? 1 : 0;
        log(nvencState == 1 ? "NVENC encoder available" : "NVENC encoder not available, using software encoding");
    }

    return nvencState == 1;
}

//==============================================================================
double FFmpegExecutor::getFileDuration(const juce::File& file)
{
    if (!file.existsAsFile())
        return 0.0;

    const auto output = runAndCapture({ getFFprobePath(), "-v", "error",
                                        "-show_entries", "format=duration",
                                        "-of", "default=noprint_wrappers=1:nokey=1",
                                        file.getFullPathName() }).trim();

    const double duration = output.getDoubleValue();
    return duration > 0.0 ? duration : 0.0;
}

//==============================================================================
double FFmpegExecutor::parseProgressSeconds(const juce::String& line)
{
    int timePos = line.indexOf("time=");
    if (timePos < 0)
        return -1.0;

    timePos += 5;
    int endPos = line.indexOfChar(timePos, ' ');
    if (endPos < 0)
        endPos = line.length();

    const auto timeStr = line.substring(timePos, endPos).trim();
    if (timeStr.isEmpty() || timeStr.startsWith("N/A"))
        return -1.0;

    if (!timeStr.containsChar(':'))
        return timeStr.getDoubleValue();

    // HH:MM:SS.ms
    juce::StringArray parts;
    parts.addTokens(timeStr, ":", "");
    if (parts.size() < 3)
        return -1.0;

    return parts[0].getDoubleValue() * 3600.0
         + parts[1].getDoubleValue() * 60.0
         + parts[2].getDoubleValue();
}

juce::String FFmpegExecutor::describeCommand(const juce::StringArray& command)
{
    juce::StringArray quoted;
    for (const auto& argument : command)
        quoted.add(argument.containsAnyOf(" \t'\"") ? argument.quoted() : argument);

    return quoted.joinIntoString(" ");
}

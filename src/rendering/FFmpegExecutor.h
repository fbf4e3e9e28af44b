#pragma once
#include <JuceHeader.h>

//==============================================================================
/**
 * @file FFmpegExecutor.h
 *
 * Runs FFmpeg and FFprobe as child processes.
 *
 * The class handles:
 * - Command execution with progress monitoring
 * - A per-command log file plus an aggregate log for each render session
 * - Querying durations and stream information via FFprobe
 * - Checking for FFmpeg and NVENC availability
 *
 * It never touches pixel or sample data itself; the encoder and the asset
 * loaders build argument lists and hand them over.
 */
class FFmpegExecutor
{
public:
    FFmpegExecutor();

    ~FFmpegExecutor();

    /**
     * Sets a callback function that will be called with progress updates.
     * The callback receives a value between 0.0 and 1.0 for the current command.
     */
    void setProgressCallback(std::function<void(double)> callback);

    /**
     * Sets a callback for receiving log messages.
     * @param callback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Overrides the executables. Empty strings restore the default lookup:
     * the STORYREEL_FFMPEG / STORYREEL_FFPROBE environment variables, then a
     * binary next to this executable, then the PATH.
     */
    void setExecutablePaths(const juce::String& ffmpeg, const juce::String& ffprobe);

    /**
     * Sets the directory where FFmpeg command output should be recorded.
     * A per-command log file (ffmpeg_NNN.log) plus an aggregate ffmpeg.log
     * will be created in this directory.
     */
    void setSessionLogDirectory(const juce::File& directory);

    /**
     * Runs FFmpeg with the given arguments and waits for it to finish.
     *
     * @param arguments         Everything after the executable name
     * @param expectedDuration  Output length in seconds, used to turn FFmpeg's
     *                          time= reports into progress. Pass a value <= 0
     *                          when unknown.
     * @return                  true if FFmpeg exited with code 0
     */
    bool execute(const juce::StringArray& arguments, double expectedDuration = -1.0);

    /** The last lines FFmpeg printed before the most recent failed command. */
    juce::String getLastErrorOutput() const;

    /**
     * Runs a command line and returns everything it printed.
     *
     * @param command    Executable followed by its arguments
     * @param timeoutMs  How long to wait before giving up on the process
     */
    juce::String runAndCapture(const juce::StringArray& command, int timeoutMs = 10000);

    juce::String getFFmpegPath() const;
    juce::String getFFprobePath() const;

    /** True if "ffmpeg -version" runs and exits cleanly. */
    bool checkFFmpegAvailability();

    /** True if this FFmpeg build lists the h264_nvenc encoder. */
    bool isNVENCAvailable();

    /**
     * Gets the duration of a media file in seconds using FFprobe.
     * @return The duration, or 0 if unavailable
     */
    double getFileDuration(const juce::File& file);

    /**
     * Extracts the position from an FFmpeg status line such as
     * "frame=  123 fps= 42 ... time=00:00:12.34 bitrate=...".
     *
     * @return Seconds encoded so far, or -1.0 if the line has no time= field
     */
    static double parseProgressSeconds(const juce::String& line);

    /** Renders an argument list as a single line for the logs. */
    static juce::String describeCommand(const juce::StringArray& command);

private:
    juce::File getNextCommandLogFile(int& outIndex);
    void writeToAggregateLog(const juce::String& message);
    void log(const juce::String& message) const;

    //==========================================================================
    std::unique_ptr<juce::ChildProcess> activeProcess;
    juce::CriticalSection processLock;

    std::function<void(double)> progressCallback;
    std::function<void(const juce::String&)> logCallback;

    juce::String ffmpegOverride;
    juce::String ffprobeOverride;
    juce::String lastErrorOutput;

    int nvencState { -1 };

    //==========================================================================
    juce::CriticalSection logDirectoryLock;
    juce::File sessionLogDirectory;
    juce::File sessionAggregateLogFile;
    bool sessionLoggingEnabled { false };
    int sessionCommandIndex { 0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegExecutor)
};

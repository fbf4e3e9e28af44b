#pragma once
#include <JuceHeader.h>
#include "RenderOptions.h"
#include "../rendering/RenderEngine.h"
#include "../rendering/RenderTypes.h"

/**
 * Runs a render on a background thread and keeps a JSON record of it.
 *
 * The record holds the job status (queued, running, completed, failed or
 * abandoned), progress in percent, the current step and, once finished, the
 * render result. It is rewritten on every change so another process can
 * poll it.
 */
class RenderJob : private juce::Thread
{
public:
    RenderJob(const RenderTypes::RenderRequest& request, const RenderOptions& options, const juce::File& statusFile);
    ~RenderJob() override;

    /** Called with progress in percent and the current step. Runs on the job thread. */
    void setProgressCallback(std::function<void(int, const juce::String&)> callback);

    /** Called once with the result when the render ends. Runs on the job thread. */
    void setCompletionCallback(std::function<void(const RenderTypes::RenderResult&)> callback);

    /** Forwarded to the engine's log callback. */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Starts the render and returns immediately. Returns false if the job was already started. */
    bool start();

    /**
     * Flags the record as abandoned by whoever was waiting for it. The render
     * itself keeps going.
     */
    void markAbandoned();

    /** Waits for the render to end. A negative timeout waits forever. */
    bool waitForCompletion(int timeoutMs = -1);

    bool isFinished() const;

    RenderTypes::RenderResult getResult() const;

    /** A copy of the current record. */
    juce::var getRecord() const;

    juce::File getStatusFile() const { return statusFile; }

private:
    void run() override;
    void updateRecord(const juce::String& status, int progress, const juce::String& step);
    void writeRecord();

    RenderTypes::RenderRequest request;
    RenderEngine engine;
    juce::File statusFile;

    mutable juce::CriticalSection recordLock;
    juce::var record;
    RenderTypes::RenderResult result;
    bool started = false;
    bool finished = false;
    bool abandoned = false;
    juce::WaitableEvent completionEvent { true };

    std::function<void(int, const juce::String&)> progressCallback;
    std::function<void(const RenderTypes::RenderResult&)> completionCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderJob)
};

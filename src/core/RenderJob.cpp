#include "RenderJob.h"
#include "../utils/VarHelpers.h"

using namespace RenderTypes;

RenderJob::RenderJob(const RenderRequest& renderRequest, const RenderOptions& options, const juce::File& file)
    : Thread("RenderJob"),
      request(renderRequest),
      engine(options),
      statusFile(file),
      record(VarHelpers::makeObject())
{
    VarHelpers::set(record, "output", request.outputFile.getFullPathName());

    engine.setProgressCallback([this](double progress)
    {
        int percent;
        juce::String step;
        {
            juce::ScopedLock lock(recordLock);
            percent = juce::jlimit(0, 100, juce::roundToInt(progress * 100.0));

            // Progress only moves forward in the record
            if (percent <= VarHelpers::getInt(record, "progress", 0))
                return;

            step = VarHelpers::getString(record, "step");
        }

        updateRecord("running", percent, step);
    });

    engine.setStateCallback([this](RenderEngine::RenderState state, const juce::String& message)
    {
        int percent;
        {
            juce::ScopedLock lock(recordLock);
            percent = VarHelpers::getInt(record, "progress", 0);
        }

        if (state != RenderEngine::RenderState::Completed && state != RenderEngine::RenderState::Failed)
            updateRecord("running", percent, message);
    });
}

RenderJob::~RenderJob()
{
    // A started render always runs to the end
    if (isThreadRunning())
        waitForThreadToExit(-1);
}

void RenderJob::setProgressCallback(std::function<void(int, const juce::String&)> callback)
{
    progressCallback = callback;
}

void RenderJob::setCompletionCallback(std::function<void(const RenderResult&)> callback)
{
    completionCallback = callback;
}

void RenderJob::setLogCallback(std::function<void(const juce::String&)> callback)
{
    engine.setLogCallback(callback);
}

//==============================================================================
bool RenderJob::start()
{
    {
        juce::ScopedLock lock(recordLock);
        if (started)
            return false;
        started = true;
    }

    updateRecord("queued", 0, "Queued");
    startThread();
    return true;
}

void RenderJob::markAbandoned()
{
    {
        juce::ScopedLock lock(recordLock);
        abandoned = true;
        VarHelpers::set(record, "status", "abandoned");
    }

    writeRecord();
}

bool RenderJob::waitForCompletion(int timeoutMs)
{
    return completionEvent.wait(timeoutMs < 0 ? -1.0 : (double) timeoutMs);
}

bool RenderJob::isFinished() const
{
    juce::ScopedLock lock(recordLock);
    return finished;
}

RenderResult RenderJob::getResult() const
{
    juce::ScopedLock lock(recordLock);
    return result;
}

juce::var RenderJob::getRecord() const
{
    juce::ScopedLock lock(recordLock);
    return record.clone();
}

//==============================================================================
void RenderJob::run()
{
    updateRecord("running", 0, "Starting");

    const auto renderResult = engine.render(request);

    {
        juce::ScopedLock lock(recordLock);
        result = renderResult;
        finished = true;

        const auto resultVar = renderResult.toVar();
        if (auto* object = resultVar.getDynamicObject())
            for (const auto& property : object->getProperties())
                if (property.name.toString() != "status")
                    VarHelpers::set(record, property.name, property.value);
    }

    updateRecord(renderResult.success ? "completed" : "failed",
                 renderResult.success ? 100 : VarHelpers::getInt(getRecord(), "progress", 0),
                 renderResult.success ? "Completed" : "Failed");

    if (completionCallback)
        completionCallback(renderResult);

    completionEvent.signal();
}

void RenderJob::updateRecord(const juce::String& status, int progress, const juce::String& step)
{
    {
        juce::ScopedLock lock(recordLock);

        // An abandoned record stays abandoned
        VarHelpers::set(record, "status", abandoned ? juce::String("abandoned") : status);
        VarHelpers::set(record, "progress", progress);
        VarHelpers::set(record, "step", step);
        VarHelpers::set(record, "updated_at", juce::Time::getCurrentTime().toISO8601(true));
    }

    writeRecord();

    if (progressCallback)
        progressCallback(progress, step);
}

void RenderJob::writeRecord()
{
    if (statusFile == juce::File())
        return;

    juce::ScopedLock lock(recordLock);

    // Readers must never see a partly written record
    const auto temporary = statusFile.getSiblingFile(statusFile.getFileName() + ".tmp");
    statusFile.getParentDirectory().createDirectory();

    if (!temporary.replaceWithText(juce::JSON::toString(record)) || !temporary.moveFileTo(statusFile))
        juce::Logger::writeToLog("WARNING: Could not write job status to " + statusFile.getFullPathName());
}

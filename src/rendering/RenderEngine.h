#pragma once
#include <JuceHeader.h>
#include <atomic>
#include <vector>
#include "RenderTypes.h"
#include "FFmpegExecutor.h"
#include "AudioMixer.h"
#include "../core/RenderOptions.h"
#include "../effects/EffectRegistry.h"
#include "../template/TemplateTypes.h"

class AssetFetcher;

/**
 * Runs one render from template to output file.
 *
 * The pipeline is: check required variables, resolve placeholders, parse the
 * template, fetch the narration, work out the timeline length, distribute the
 * media across sections, expand array layers, synthesise and compose the
 * clips, then encode and mux. Output files with an audio extension skip the
 * pictures and receive the mixed narration only.
 *
 * render() is synchronous; RenderJob runs it on a background thread. Each
 * render writes a session log directory (render.log plus one log per FFmpeg
 * command) under the options' log root, and works in a temporary directory
 * that is removed when the render finishes unless keepTempFiles is set.
 *
 * Only missing inputs and encoder failures fail a render. Unreachable assets,
 * broken effects and music that cannot be mixed are logged as warnings and
 * degrade the output instead.
 */
class RenderEngine
{
public:
    using RenderState = RenderTypes::RenderState;
    using StateCallback = std::function<void(RenderState, const juce::String&)>;

    explicit RenderEngine(const RenderOptions& options);
    ~RenderEngine();

    /** Receives every log line of the render in addition to the session log. */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Receives overall progress from 0 to 1. */
    void setProgressCallback(std::function<void(double)> callback);

    void setStateCallback(StateCallback callback);

    /** Renders the request. Never throws. */
    RenderTypes::RenderResult render(const RenderTypes::RenderRequest& request);

    RenderState getState() const { return state.load(); }

    /** The session log directory of the current or last render. */
    juce::File getSessionDirectory() const { return renderSessionDirectory; }

    //==============================================================================
    /**
     * Length of the timeline: the narration if there is one, otherwise the
     * sum of the section durations, otherwise the latest layer end, otherwise
     * the default.
     */
    static double computeTotalDuration(double narrationDuration,
                                       const std::vector<RenderTypes::Section>& sections,
                                       const std::vector<RenderTypes::Layer>& layers,
                                       double defaultDuration);

    /** Assets named by array layer sources, in layer order. */
    static std::vector<RenderTypes::MediaAsset> discoverAssets(const std::vector<RenderTypes::Layer>& layers);

    /**
     * The template's effects followed by the background_music and
     * logo_watermark effects described by its background_music and logo
     * blocks. Source URLs are left in music_path and logo_path for fetching.
     */
    static std::vector<RenderTypes::EffectSpec> collectEffects(const RenderTypes::Template& parsed);

    /** True when the output extension asks for audio only. */
    static bool isAudioOnlyOutput(const juce::File& outputFile);

    /** Human readable elapsed time, for example "1m 5s". */
    static juce::String formatElapsedTime(double seconds);

private:
    RenderTypes::RenderResult runPipeline(const RenderTypes::RenderRequest& request, const juce::File& workDirectory);

    juce::Result prepareNarration(const RenderTypes::RenderRequest& request,
                                  AssetFetcher& fetcher,
                                  const juce::File& workDirectory,
                                  std::vector<RenderTypes::Section>& sections,
                                  std::shared_ptr<const AudioTrack>& narration);

    juce::Result decodeAudio(const juce::String& reference, AssetFetcher& fetcher,
                             const juce::File& workDirectory, const juce::String& name,
                             std::shared_ptr<const AudioTrack>& track);

    void localiseEffectSources(std::vector<RenderTypes::EffectSpec>& effects, AssetFetcher& fetcher) const;

    RenderTypes::RenderResult renderAudioOnly(const Clip& timeline, const juce::File& workDirectory,
                                              const juce::File& outputFile);

    void updateState(RenderState newState, const juce::String& statusMessage);
    void setProgress(double value);

    void initialiseLoggingSession();
    void teardownLoggingSession();

    RenderOptions options;
    EffectRegistry registry;
    std::unique_ptr<FFmpegExecutor> ffmpegExecutor;
    std::unique_ptr<AudioMixer> audioMixer;

    std::function<void(const juce::String&)> logCallback;
    std::function<void(double)> progressCallback;
    StateCallback stateCallback;

    std::atomic<RenderState> state { RenderState::Idle };
    juce::Time renderStartTime;

    // Function for logging to the session log and the JUCE logger
    std::function<void(const juce::String&)> logFunction;

    juce::File renderSessionDirectory;
    std::unique_ptr<juce::FileOutputStream> renderSessionLogStream;
    juce::CriticalSection logWriteLock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderEngine)
};

#include "RenderEngine.h"
#include "AssetFetcher.h"
#include "ClipSynthesizer.h"
#include "CompositionOrchestrator.h"
#include "SegmentEncoder.h"
#include "../effects/EffectsPipeline.h"
#include "../template/LayerExpander.h"
#include "../template/TemplateParser.h"
#include "../template/VariableResolver.h"
#include "../timing/MediaTimingDistributor.h"
#include "../utils/VarHelpers.h"
#include <algorithm>

using namespace RenderTypes;

namespace
{
    juce::File createTimestampedDirectory(const juce::File& root, const juce::String& prefix)
    {
        if (!root.isDirectory() && !root.createDirectory())
            return {};

        const juce::String timestamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
        auto sessionDir = root.getChildFile(prefix + "_" + timestamp);

        // Two renders started within the same second get separate directories
        for (int suffix = 2; sessionDir.exists(); ++suffix)
            sessionDir = root.getChildFile(prefix + "_" + timestamp + "_" + juce::String(suffix));

        sessionDir.createDirectory();
        return sessionDir;
    }

    /** Owns the per-render scratch directory and removes it on every exit path. */
    class ScopedWorkDirectory
    {
    public:
        ScopedWorkDirectory(const juce::File& root, bool keepFiles)
            : keep(keepFiles)
        {
            directory = root.getNonexistentChildFile("storyreel_"
                                                     + juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S"),
                                                     {}, false);
            if (!directory.createDirectory())
                directory = juce::File();
        }

        ~ScopedWorkDirectory()
        {
            if (!keep && directory.isDirectory())
                directory.deleteRecursively();
        }

        const juce::File& get() const { return directory; }
        bool isValid() const { return directory.isDirectory(); }

    private:
        juce::File directory;
        bool keep;

        JUCE_DECLARE_NON_COPYABLE(ScopedWorkDirectory)
    };

    juce::var objectOrUrl(const juce::var& block)
    {
        if (block.isString())
        {
            auto object = VarHelpers::makeObject();
            VarHelpers::set(object, "url", block);
            return object;
        }

        return block;
    }

    bool isEnabledBlock(const juce::var& block)
    {
        return block.isObject()
            && VarHelpers::getBool(block, "enabled", true)
            && VarHelpers::getString(block, "url", VarHelpers::getString(block, "path")).isNotEmpty();
    }

    void copyIfPresent(const juce::var& from, const juce::Identifier& fromKey, juce::var& to, const juce::Identifier& toKey)
    {
        if (VarHelpers::has(from, fromKey))
            VarHelpers::set(to, toKey, VarHelpers::get(from, fromKey));
    }

    double sumSectionDurations(const std::vector<Section>& sections)
    {
        double total = 0.0;
        for (const auto& section : sections)
            total += juce::jmax(0.0, section.audioDuration);
        return total;
    }
}

//==============================================================================
RenderEngine::RenderEngine(const RenderOptions& renderOptions)
    : options(renderOptions),
      ffmpegExecutor(std::make_unique<FFmpegExecutor>()),
      audioMixer(std::make_unique<AudioMixer>())
{
    ffmpegExecutor->setExecutablePaths(options.ffmpegPath, options.ffprobePath);
}

RenderEngine::~RenderEngine()
{
    teardownLoggingSession();
}

void RenderEngine::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void RenderEngine::setProgressCallback(std::function<void(double)> callback)
{
    progressCallback = callback;
}

void RenderEngine::setStateCallback(StateCallback callback)
{
    stateCallback = callback;
}

//==============================================================================
void RenderEngine::initialiseLoggingSession()
{
    teardownLoggingSession();

    renderSessionDirectory = createTimestampedDirectory(options.getLogRoot(), "render");

    if (renderSessionDirectory.isDirectory())
    {
        auto ffmpegLogDirectory = renderSessionDirectory.getChildFile("ffmpeg");
        ffmpegLogDirectory.createDirectory();
        ffmpegExecutor->setSessionLogDirectory(ffmpegLogDirectory);

        auto renderLogFile = renderSessionDirectory.getChildFile("render.log");
        if (renderLogFile.existsAsFile())
            renderLogFile.deleteFile();

        renderSessionLogStream = std::make_unique<juce::FileOutputStream>(renderLogFile);
        if (renderSessionLogStream->openedOk())
        {
            renderSessionLogStream->writeText("Render session started at "
                                              + juce::Time::getCurrentTime().toString(true, true) + "\n",
                                              false, false, nullptr);
            renderSessionLogStream->flush();
        }
        else
        {
            renderSessionLogStream.reset();
        }
    }
    else
    {
        ffmpegExecutor->setSessionLogDirectory(juce::File());
    }

    logFunction = [this](const juce::String& message)
    {
        juce::Logger::writeToLog("[RENDER] " + message);

        const juce::String stampedMessage = juce::Time::getCurrentTime().toString(true, true) + ": " + message;

        {
            juce::ScopedLock lock(logWriteLock);
            if (renderSessionLogStream != nullptr)
            {
                renderSessionLogStream->writeText(stampedMessage + "\n", false, false, nullptr);
                renderSessionLogStream->flush();
            }
        }

        if (logCallback)
            logCallback(message);
    };
}

void RenderEngine::teardownLoggingSession()
{
    {
        juce::ScopedLock lock(logWriteLock);
        if (renderSessionLogStream != nullptr)
            renderSessionLogStream->flush();
        renderSessionLogStream.reset();
    }

    ffmpegExecutor->setSessionLogDirectory(juce::File());
}

void RenderEngine::updateState(RenderState newState, const juce::String& statusMessage)
{
    state.store(newState);

    juce::Logger::writeToLog("RENDER STATUS: " + statusMessage);

    if (logFunction)
        logFunction("State changed to: " + renderStateToString(newState) + " - " + statusMessage);

    if (stateCallback)
        stateCallback(newState, statusMessage);
}

void RenderEngine::setProgress(double value)
{
    if (progressCallback)
        progressCallback(juce::jlimit(0.0, 1.0, value));
}

//==============================================================================
RenderResult RenderEngine::render(const RenderRequest& request)
{
    renderStartTime = juce::Time::getCurrentTime();

    initialiseLoggingSession();

    logFunction("=== RENDER LOG ===");
    if (renderSessionDirectory.isDirectory())
        logFunction("Log directory: " + renderSessionDirectory.getFullPathName());
    logFunction("Render started at: " + renderStartTime.toString(true, true));
    logFunction("Output file: " + request.outputFile.getFullPathName());
    logFunction("Sections: " + juce::String((int) request.sections.size())
                + ", assets: " + juce::String((int) request.assets.size())
                + ", mode: " + juce::String(request.mode == DistributionMode::Manual ? "manual" : "auto"));
    logFunction("Hardware encoding requested: " + juce::String(options.useHardwareEncoding ? "yes" : "no"));

    updateState(RenderState::Starting, "Preparing to render...");
    setProgress(0.0);

    RenderResult result;

    {
        ScopedWorkDirectory workDirectory(options.getTempRoot(), options.keepTempFiles);

        if (!workDirectory.isValid())
        {
            result = RenderResult::failed(FailureKind::EncodeError,
                                          "Failed to create a working directory under "
                                          + options.getTempRoot().getFullPathName());
        }
        else
        {
            logFunction("Working directory: " + workDirectory.get().getFullPathName());

            try
            {
                result = runPipeline(request, workDirectory.get());
            }
            catch (const std::exception& e)
            {
                result = RenderResult::failed(FailureKind::EncodeError,
                                              "Unexpected error during render: " + juce::String(e.what()));
            }

            if (options.keepTempFiles)
                logFunction("Keeping temporary files in " + workDirectory.get().getFullPathName());
        }
    }

    const double elapsed = (juce::Time::getCurrentTime() - renderStartTime).inSeconds();

    if (result.success)
    {
        setProgress(1.0);
        updateState(RenderState::Completed, "Render completed in " + formatElapsedTime(elapsed));
        logFunction("Output: " + result.outputFile.getFullPathName() + " ("
                    + juce::String(result.duration, 2) + "s, " + juce::String(result.fileSize / 1024) + " KB)");
    }
    else
    {
        if (request.outputFile.existsAsFile() && result.failure == FailureKind::EncodeError)
            request.outputFile.deleteFile();

        logFunction("ERROR: " + result.message);
        updateState(RenderState::Failed, "Render failed after " + formatElapsedTime(elapsed) + ": " + result.message);
    }

    teardownLoggingSession();
    return result;
}

RenderResult RenderEngine::runPipeline(const RenderRequest& request, const juce::File& workDirectory)
{
    if (request.outputFile == juce::File())
        return RenderResult::failed(FailureKind::InputError, "No output file given");

    if (!request.templateDocument.isObject())
        return RenderResult::failed(FailureKind::InputError, "Template document is not a JSON object");

    //==========================================================================
    updateState(RenderState::ResolvingTemplate, "Resolving template variables...");

    auto templateDocument = request.templateDocument;
    if (request.overrides.isObject())
    {
        logFunction("Applying template overrides");
        templateDocument = VariableResolver::mergeOverrides(templateDocument, request.overrides);
    }

    const auto missing = VariableResolver::findMissingRequired(templateDocument, request.variables);
    if (!missing.isEmpty())
        return RenderResult::failed(FailureKind::InputError,
                                    "Missing required variables: " + missing.joinIntoString(", "));

    VariableResolver resolver;
    resolver.setLogCallback(logFunction);
    const auto resolved = resolver.resolve(templateDocument, request.variables);

    TemplateParser parser;
    parser.setLogCallback(logFunction);

    Template parsed;
    const auto parseResult = parser.parse(resolved, parsed);
    if (parseResult.failed())
        return RenderResult::failed(FailureKind::InputError, "Invalid template: " + parseResult.getErrorMessage());

    const int canvasWidth = parsed.width > 0 ? parsed.width : options.defaultWidth;
    const int canvasHeight = parsed.height > 0 ? parsed.height : options.defaultHeight;

    logFunction("Template '" + parsed.name + "': " + juce::String((int) parsed.layers.size()) + " layers, "
                + juce::String((int) parsed.effects.size()) + " effects, "
                + juce::String(canvasWidth) + "x" + juce::String(canvasHeight) + " (" + parsed.aspectRatio + ")");

    AssetFetcher fetcher(workDirectory.getChildFile("assets"), options.downloadTimeoutSeconds);
    fetcher.setLogCallback(logFunction);

    auto effects = collectEffects(parsed);
    localiseEffectSources(effects, fetcher);
    setProgress(0.05);

    //==========================================================================
    updateState(RenderState::PreparingAudio, "Preparing narration...");

    std::vector<Section> sections = request.sections;
    std::shared_ptr<const AudioTrack> narration;

    const auto audioResult = prepareNarration(request, fetcher, workDirectory, sections, narration);
    if (audioResult.failed())
        return RenderResult::failed(FailureKind::InputError, audioResult.getErrorMessage());

    const double narrationDuration = narration != nullptr ? narration->getDuration() : 0.0;
    const double totalDuration = computeTotalDuration(narrationDuration, sections, parsed.layers, options.defaultDuration);

    logFunction("Total duration: " + juce::String(totalDuration, 2) + " seconds"
                + (narration != nullptr ? " (narration)" : ""));
    setProgress(0.1);

    EffectsPipeline pipeline(registry);
    pipeline.setLogCallback(logFunction);

    //==========================================================================
    if (isAudioOnlyOutput(request.outputFile))
    {
        logFunction("Audio only output requested");

        auto carrier = ClipOps::createSolid(juce::Colours::black, 2, 2, totalDuration);
        carrier.audio = narration;

        for (const auto& effect : effects)
        {
            auto instance = registry.create(effect.type);
            if (effect.isGlobal() && instance != nullptr && instance->getName() == "background_music")
                carrier = pipeline.apply(carrier, effect.type, effect.params);
        }

        return renderAudioOnly(carrier, workDirectory, request.outputFile);
    }

    //==========================================================================
    updateState(RenderState::DistributingMedia, "Distributing media across sections...");

    auto assets = request.assets.empty() ? discoverAssets(parsed.layers) : request.assets;

    TimingIndex timingIndex;
    if (!sections.empty() && !assets.empty())
    {
        MediaTimingDistributor distributor;
        distributor.setLogCallback(logFunction);

        const auto distribution = distributor.distribute(assets, sections, request.mode,
                                                         MediaTimingDistributor::mappingFromVar(request.mapping));
        timingIndex = distribution.createIndex();

        logFunction("Distributed " + juce::String((int) timingIndex.size()) + " assets over "
                    + juce::String((int) sections.size()) + " sections");
    }

    LayerExpander expander;
    expander.setLogCallback(logFunction);
    const auto layers = expander.expand(parsed.layers, timingIndex, totalDuration);

    logFunction("Expanded to " + juce::String((int) layers.size()) + " layers");
    setProgress(0.15);

    //==========================================================================
    updateState(RenderState::ComposingTimeline, "Composing timeline...");

    ClipSynthesizer synthesizer(*ffmpegExecutor, fetcher, pipeline, workDirectory.getChildFile("clips"),
                                canvasWidth, canvasHeight, options.fps);
    synthesizer.setLogCallback(logFunction);

    CompositionOrchestrator orchestrator(pipeline, canvasWidth, canvasHeight);
    orchestrator.setLogCallback(logFunction);
    if (options.autoTransitions)
        orchestrator.setDefaultTransition(options.getDefaultTransition());

    Clip background;
    const bool needsBackground = std::none_of(layers.begin(), layers.end(),
                                              [](const Layer& layer) { return CompositionOrchestrator::isBaseLayer(layer); });

    if (needsBackground)
    {
        auto backgroundFile = request.backgroundClip != juce::File() ? request.backgroundClip
                                                                     : options.getBackgroundClip(parsed.aspectRatio);

        if (backgroundFile == juce::File())
            return RenderResult::failed(FailureKind::InputError,
                                        "The template has no video layers and no background clip is configured for "
                                        + parsed.aspectRatio);

        const auto backgroundResult = synthesizer.loadBackground(backgroundFile, totalDuration, background);
        if (backgroundResult.failed())
            return RenderResult::failed(FailureKind::InputError, backgroundResult.getErrorMessage());
    }

    CompositionOrchestrator::Composition composition;
    const auto composeResult = orchestrator.composeLayers(synthesizer, layers, effects,
                                                          needsBackground ? &background : nullptr,
                                                          narration, composition);
    if (composeResult.failed())
        return RenderResult::failed(FailureKind::InputError, composeResult.getErrorMessage());

    const auto segments = composition.planSegments(options.fps);
    logFunction("Timeline: " + juce::String(composition.timeline.duration, 2) + "s in "
                + juce::String((int) segments.size()) + " segments");
    setProgress(0.25);

    //==========================================================================
    updateState(RenderState::EncodingSegments, "Encoding video...");

    SegmentEncoder encoder(*ffmpegExecutor, options, workDirectory.getChildFile("segments"));
    encoder.setLogCallback(logFunction);
    encoder.setProgressCallback([this](double value) { setProgress(0.25 + 0.65 * value); });

    const auto videoFile = workDirectory.getChildFile("video.mp4");
    const auto encodeResult = encoder.encode(composition.timeline, segments, videoFile);
    if (encodeResult.failed())
        return RenderResult::failed(FailureKind::EncodeError, encodeResult.getErrorMessage());

    //==========================================================================
    updateState(RenderState::Finalizing, "Adding audio...");

    if (!request.outputFile.getParentDirectory().createDirectory())
        return RenderResult::failed(FailureKind::EncodeError,
                                    "Cannot create output directory: " + request.outputFile.getParentDirectory().getFullPathName());

    if (request.outputFile.existsAsFile())
        request.outputFile.deleteFile();

    if (composition.timeline.audio != nullptr)
    {
        const auto mixFile = workDirectory.getChildFile("mix.wav");
        if (!audioMixer->writeWav(*composition.timeline.audio, mixFile))
            return RenderResult::failed(FailureKind::EncodeError, "Failed to write the mixed audio track");

        const auto muxResult = encoder.muxAudio(videoFile, mixFile, request.outputFile);
        if (muxResult.failed())
            return RenderResult::failed(FailureKind::EncodeError, muxResult.getErrorMessage());
    }
    else
    {
        logFunction("WARNING: No audio for this render, the output is silent");

        if (!videoFile.copyFileTo(request.outputFile))
            return RenderResult::failed(FailureKind::EncodeError, "Could not write " + request.outputFile.getFullPathName());
    }

    double duration = ffmpegExecutor->getFileDuration(request.outputFile);
    if (duration <= 0.0)
        duration = composition.timeline.duration;

    return RenderResult::succeeded(request.outputFile, duration, request.outputFile.getSize());
}

//==============================================================================
juce::Result RenderEngine::prepareNarration(const RenderRequest& request,
                                            AssetFetcher& fetcher,
                                            const juce::File& workDirectory,
                                            std::vector<Section>& sections,
                                            std::shared_ptr<const AudioTrack>& narration)
{
    if (request.narrationUrl.isNotEmpty())
    {
        const auto result = decodeAudio(request.narrationUrl, fetcher, workDirectory, "narration", narration);
        if (result.failed())
            return juce::Result::fail("Missing required narration audio: " + result.getErrorMessage());

        for (auto& section : sections)
        {
            if (!section.hasDuration())
            {
                logFunction("WARNING: Section '" + section.title + "' has no audio duration, using "
                            + juce::String(options.sectionFallbackDuration, 1) + "s");
                section.audioDuration = options.sectionFallbackDuration;
            }
        }

        return juce::Result::ok();
    }

    const bool anySectionAudio = std::any_of(sections.begin(), sections.end(),
                                             [](const Section& section) { return section.audioUrl.isNotEmpty(); });

    std::vector<std::shared_ptr<const AudioTrack>> parts;

    for (size_t i = 0; i < sections.size(); ++i)
    {
        auto& section = sections[i];
        std::shared_ptr<const AudioTrack> part;

        if (section.audioUrl.isNotEmpty())
        {
            const auto result = decodeAudio(section.audioUrl, fetcher, workDirectory,
                                            "section_" + juce::String((int) i), part);
            if (result.failed())
                return juce::Result::fail("Missing required audio for section '" + section.title + "': "
                                          + result.getErrorMessage());

            if (!section.hasDuration())
                section.audioDuration = part->getDuration();
        }

        if (!section.hasDuration())
        {
            logFunction("WARNING: Section '" + section.title + "' has no audio duration, using "
                        + juce::String(options.sectionFallbackDuration, 1) + "s");
            section.audioDuration = options.sectionFallbackDuration;
        }

        if (!anySectionAudio)
            continue;

        // Silence keeps later sections in step with their media
        if (part == nullptr)
        {
            auto silence = std::make_shared<AudioTrack>();
            silence->buffer.setSize(AudioMixer::numChannels,
                                    (int) std::llround(section.audioDuration * AudioMixer::sampleRate));
            silence->buffer.clear();
            part = silence;
        }

        parts.push_back(part);
    }

    if (anySectionAudio)
    {
        narration = AudioMixer::concatenate(parts);
        logFunction("Joined narration from " + juce::String((int) parts.size()) + " sections ("
                    + juce::String(narration->getDuration(), 2) + "s)");
    }

    return juce::Result::ok();
}

juce::Result RenderEngine::decodeAudio(const juce::String& reference, AssetFetcher& fetcher,
                                       const juce::File& workDirectory, const juce::String& name,
                                       std::shared_ptr<const AudioTrack>& track)
{
    juce::File localFile;
    const auto fetchResult = fetcher.fetch(reference, localFile);
    if (fetchResult.failed())
        return fetchResult;

    audioMixer->setLogCallback(logFunction);

    // WAV, AIFF, FLAC and Ogg are read directly, anything else goes through FFmpeg first
    const auto extension = localFile.getFileExtension().toLowerCase();
    const bool readable = extension == ".wav" || extension == ".aif" || extension == ".aiff"
                       || extension == ".flac" || extension == ".ogg";

    if (readable)
    {
        auto loaded = audioMixer->loadTrack(localFile);
        if (loaded != nullptr)
        {
            track = loaded;
            return juce::Result::ok();
        }
    }

    const auto audioDirectory = workDirectory.getChildFile("audio");
    audioDirectory.createDirectory();
    const auto converted = audioDirectory.getChildFile(name + ".wav");

    juce::StringArray args { "-y", "-i", localFile.getFullPathName(), "-vn",
                             "-ar", juce::String((int) AudioMixer::sampleRate),
                             "-ac", juce::String(AudioMixer::numChannels),
                             "-c:a", "pcm_s16le", converted.getFullPathName() };

    if (!ffmpegExecutor->execute(args))
        return juce::Result::fail("Could not decode " + localFile.getFileName() + ": " + ffmpegExecutor->getLastErrorOutput());

    auto loaded = audioMixer->loadTrack(converted);
    if (loaded == nullptr)
        return juce::Result::fail("Could not read decoded audio for " + localFile.getFileName());

    track = loaded;
    return juce::Result::ok();
}

void RenderEngine::localiseEffectSources(std::vector<EffectSpec>& effects, AssetFetcher& fetcher) const
{
    static const juce::StringArray pathKeys { "music_path", "logo_path" };

    for (auto& effect : effects)
    {
        if (!effect.params.isObject())
            continue;

        for (const auto& key : pathKeys)
        {
            const auto reference = VarHelpers::getString(effect.params, juce::Identifier(key));
            if (reference.isEmpty())
                continue;

            juce::File localFile;
            const auto result = fetcher.fetch(reference, localFile);

            if (result.wasOk())
                VarHelpers::set(effect.params, juce::Identifier(key), localFile.getFullPathName());
            else
                logFunction("WARNING: " + effect.type + " source unavailable, the effect will be skipped: "
                            + result.getErrorMessage());
        }
    }
}

RenderResult RenderEngine::renderAudioOnly(const Clip& timeline, const juce::File& workDirectory,
                                           const juce::File& outputFile)
{
    if (timeline.audio == nullptr)
        return RenderResult::failed(FailureKind::InputError, "Audio only output needs narration or section audio");

    updateState(RenderState::Finalizing, "Writing audio...");

    if (!outputFile.getParentDirectory().createDirectory())
        return RenderResult::failed(FailureKind::EncodeError,
                                    "Cannot create output directory: " + outputFile.getParentDirectory().getFullPathName());

    if (outputFile.existsAsFile())
        outputFile.deleteFile();

    const auto mixFile = workDirectory.getChildFile("mix.wav");
    if (!audioMixer->writeWav(*timeline.audio, mixFile))
        return RenderResult::failed(FailureKind::EncodeError, "Failed to write the mixed audio track");

    const auto extension = outputFile.getFileExtension().toLowerCase();

    if (extension == ".wav")
    {
        logFunction("Copying WAV audio directly to output");
        if (!mixFile.copyFileTo(outputFile))
            return RenderResult::failed(FailureKind::EncodeError, "Could not write " + outputFile.getFullPathName());
    }
    else
    {
        const juce::String codec = extension == ".mp3" ? "libmp3lame" : options.audioCodec;

        juce::StringArray args { "-y", "-i", mixFile.getFullPathName(),
                                 "-c:a", codec, "-b:a", options.audioBitrate,
                                 outputFile.getFullPathName() };

        if (!ffmpegExecutor->execute(args, timeline.audio->getDuration()))
            return RenderResult::failed(FailureKind::EncodeError,
                                        "Audio encoding failed: " + ffmpegExecutor->getLastErrorOutput());
    }

    return RenderResult::succeeded(outputFile, timeline.audio->getDuration(), outputFile.getSize());
}

//==============================================================================
double RenderEngine::computeTotalDuration(double narrationDuration,
                                          const std::vector<Section>& sections,
                                          const std::vector<Layer>& layers,
                                          double defaultDuration)
{
    if (narrationDuration > 0.0)
        return narrationDuration;

    const double sectionTotal = sumSectionDurations(sections);
    if (sectionTotal > 0.0)
        return sectionTotal;

    double latestEnd = 0.0;
    for (const auto& layer : layers)
        if (layer.hasDuration())
            latestEnd = juce::jmax(latestEnd, layer.endTime());

    return latestEnd > 0.0 ? latestEnd : defaultDuration;
}

std::vector<MediaAsset> RenderEngine::discoverAssets(const std::vector<Layer>& layers)
{
    std::vector<MediaAsset> assets;

    for (const auto& layer : layers)
    {
        if (!layer.isExpandable())
            continue;

        for (const auto& url : layer.sources)
        {
            MediaAsset asset;
            asset.url = url;

            if (layer.type == LayerType::Video)
                asset.type = MediaType::Video;
            else if (layer.type == LayerType::Mixed)
                asset.type = looksLikeVideoUrl(url) ? MediaType::Video : MediaType::Image;
            else
                asset.type = MediaType::Image;

            assets.push_back(asset);
        }
    }

    return assets;
}

std::vector<EffectSpec> RenderEngine::collectEffects(const Template& parsed)
{
    auto effects = parsed.effects;

    const auto music = objectOrUrl(parsed.backgroundMusic);
    if (isEnabledBlock(music))
    {
        EffectSpec effect;
        effect.type = "background_music";
        effect.params = VarHelpers::makeObject();
        VarHelpers::set(effect.params, "music_path",
                        VarHelpers::getString(music, "url", VarHelpers::getString(music, "path")));
        copyIfPresent(music, "volume", effect.params, "music_volume");
        copyIfPresent(music, "music_volume", effect.params, "music_volume");
        copyIfPresent(music, "voice_volume", effect.params, "voice_volume");
        copyIfPresent(music, "fade_in", effect.params, "fade_in");
        copyIfPresent(music, "fade_out", effect.params, "fade_out");
        effects.push_back(effect);
    }

    const auto logo = objectOrUrl(parsed.logo);
    if (isEnabledBlock(logo))
    {
        EffectSpec effect;
        effect.type = "logo_watermark";
        effect.params = VarHelpers::makeObject();
        VarHelpers::set(effect.params, "logo_path",
                        VarHelpers::getString(logo, "url", VarHelpers::getString(logo, "path")));

        for (auto* key : { "position", "opacity", "scale", "margin" })
            copyIfPresent(logo, key, effect.params, key);

        effects.push_back(effect);
    }

    return effects;
}

bool RenderEngine::isAudioOnlyOutput(const juce::File& outputFile)
{
    const auto extension = outputFile.getFileExtension().toLowerCase();
    return extension == ".wav" || extension == ".mp3" || extension == ".m4a" || extension == ".aac";
}

juce::String RenderEngine::formatElapsedTime(double totalSeconds)
{
    int seconds = static_cast<int>(totalSeconds);

    int hours = seconds / 3600;
    seconds %= 3600;
    int minutes = seconds / 60;
    seconds %= 60;

    juce::String result;

    if (hours > 0)
        result += juce::String(hours) + "h ";

    if (minutes > 0 || hours > 0)
        result += juce::String(minutes) + "m ";

    result += juce::String(seconds) + "s";

    return result;
}

#pragma once
#include <JuceHeader.h>
#include <vector>
#include "Clip.h"
#include "FFmpegExecutor.h"
#include "AssetFetcher.h"
#include "../effects/EffectsPipeline.h"
#include "../template/TemplateTypes.h"

/**
 * Renders one template layer into a clip the size of the layer's box.
 *
 * Image, text and shape layers become a single still frame held for the
 * layer's duration. Video layers are decoded to frames by FFmpeg, looped or
 * trimmed to exactly the layer's duration, and scaled to cover the box.
 * The layer's opacity, its fade and any effects targeted at it are applied
 * before the clip is returned.
 *
 * Assets that cannot be fetched or decoded are replaced by a solid grey
 * placeholder of the same size and duration.
 */
class ClipSynthesizer
{
public:
    /**
     * @param ffmpeg         Used to decode video sources and unusual image formats
     * @param fetcher        Resolves layer sources to local files
     * @param pipeline       Applies fades and targeted effects
     * @param workDirectory  Scratch space for decoded frames
     * @param canvasWidth, canvasHeight  Size of the composition
     * @param fps            Frame rate video sources are decoded at
     */
    ClipSynthesizer(FFmpegExecutor& ffmpeg,
                    AssetFetcher& fetcher,
                    const EffectsPipeline& pipeline,
                    const juce::File& workDirectory,
                    int canvasWidth, int canvasHeight,
                    double fps);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * @param layer    A layer with a scalar source and a positive duration
     * @param effects  The template's effects; only those targeting this layer are applied
     * @return         The layer's clip, or an invalid clip for layers with no duration
     */
    Clip synthesize(const RenderTypes::Layer& layer, const std::vector<RenderTypes::EffectSpec>& effects);

    /**
     * Loads the externally supplied base clip, covering the whole canvas and
     * fitted to the duration.
     */
    juce::Result loadBackground(const juce::File& file, double duration, Clip& clip);

    /** The layer's box on the canvas, at least one pixel in each direction. */
    static juce::Rectangle<int> layerBounds(const RenderTypes::Layer& layer, int canvasWidth, int canvasHeight);

    static juce::Image renderText(const RenderTypes::Layer& layer, int width, int height);
    static juce::Image renderShape(const RenderTypes::Layer& layer, int width, int height);

    /** Params for the fade effect built from a layer's fade settings. */
    static juce::var fadeParams(const RenderTypes::FadeSpec& fade);

    static Clip createPlaceholder(int width, int height, double duration);

private:
    Clip synthesizeContent(const RenderTypes::Layer& layer, int width, int height);
    Clip loadImageClip(const juce::File& file, int width, int height, double duration);
    Clip loadVideoClip(const juce::File& file, int width, int height, double duration);
    juce::Image decodeImage(const juce::File& file);
    void log(const juce::String& message) const;

    FFmpegExecutor& ffmpeg;
    AssetFetcher& fetcher;
    const EffectsPipeline& pipeline;
    juce::File workDirectory;
    int canvasWidth;
    int canvasHeight;
    double fps;
    int decodeCounter = 0;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ClipSynthesizer)
};

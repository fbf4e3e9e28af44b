#include "ClipSynthesizer.h"
#include "../utils/VarHelpers.h"

namespace
{
    const juce::Colour placeholderColour (0xff808080);

    /**
     * Frames decoded by FFmpeg into a directory, read back on demand.
     * The most recently used frame is kept so consecutive requests for the
     * same index do not hit the disk again.
     */
    class VideoFrameSequence
    {
    public:
        VideoFrameSequence(const juce::File& dir, int count, double rate, int w, int h)
            : directory(dir), frameCount(count), fps(rate), width(w), height(h)
        {
        }

        juce::Image frameAt(double t)
        {
            const int index = juce::jlimit(0, frameCount - 1, (int) std::floor(t * fps + 1.0e-6));

            const juce::ScopedLock sl(lock);
            if (index == cachedIndex && cachedFrame.isValid())
                return cachedFrame;

            const auto file = directory.getChildFile(juce::String::formatted("frame_%05d.jpg", index + 1));
            auto decoded = juce::ImageFileFormat::loadFrom(file);

            if (!decoded.isValid())
                decoded = cachedFrame.isValid() ? cachedFrame : ClipOps::createBlankFrame(width, height);
            else if (decoded.getWidth() != width || decoded.getHeight() != height)
                decoded = ClipOps::coverToSize(decoded, width, height);

            cachedFrame = decoded.convertedToFormat(juce::Image::ARGB);
            cachedIndex = index;
            return cachedFrame;
        }

    private:
        juce::File directory;
        int frameCount;
        double fps;
        int width;
        int height;

        juce::CriticalSection lock;
        int cachedIndex = -1;
        juce::Image cachedFrame;
    };

    juce::Justification justificationFor(const juce::String& align)
    {
        const auto lower = align.trim().toLowerCase();
        if (lower == "left")
            return juce::Justification::centredLeft;
        if (lower == "right")
            return juce::Justification::centredRight;
        return juce::Justification::centred;
    }
}

//==============================================================================
ClipSynthesizer::ClipSynthesizer(FFmpegExecutor& ffmpegToUse,
                                 AssetFetcher& fetcherToUse,
                                 const EffectsPipeline& pipelineToUse,
                                 const juce::File& directory,
                                 int width, int height,
                                 double frameRate)
    : ffmpeg(ffmpegToUse),
      fetcher(fetcherToUse),
      pipeline(pipelineToUse),
      workDirectory(directory),
      canvasWidth(width),
      canvasHeight(height),
      fps(frameRate)
{
}

void ClipSynthesizer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void ClipSynthesizer::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

//==============================================================================
juce::Rectangle<int> ClipSynthesizer::layerBounds(const RenderTypes::Layer& layer, int width, int height)
{
    const int x = juce::roundToInt(layer.x * width);
    const int y = juce::roundToInt(layer.y * height);
    const int w = juce::jmax(1, juce::roundToInt(layer.width * width));
    const int h = juce::jmax(1, juce::roundToInt(layer.height * height));
    return { x, y, w, h };
}

juce::var ClipSynthesizer::fadeParams(const RenderTypes::FadeSpec& fade)
{
    auto params = VarHelpers::makeObject();
    VarHelpers::set(params, "fade_in_duration", fade.fadeIn);
    VarHelpers::set(params, "fade_out_duration", fade.fadeOut);
    VarHelpers::set(params, "fade_type", fade.type);
    return params;
}

Clip ClipSynthesizer::createPlaceholder(int width, int height, double duration)
{
    return ClipOps::createSolid(placeholderColour, width, height, duration);
}

//==============================================================================
juce::Image ClipSynthesizer::renderText(const RenderTypes::Layer& layer, int width, int height)
{
    auto image = ClipOps::createBlankFrame(width, height);

    {
        juce::Graphics g(image);

        const auto background = VarHelpers::parseColour(juce::var(layer.backgroundColour), juce::Colours::transparentBlack);
        if (!background.isTransparent())
            g.fillAll(background);

        const juce::Font font(layer.fontFamily, juce::jmax(1.0f, layer.fontSize),
                              layer.bold ? juce::Font::bold : juce::Font::plain);
        g.setFont(font);
        g.setColour(VarHelpers::parseColour(juce::var(layer.textColour), juce::Colours::white));

        const int padding = juce::roundToInt(font.getHeight() * 0.25f);
        const auto area = image.getBounds().reduced(juce::jmin(padding, width / 4), juce::jmin(padding, height / 4));
        const int maxLines = juce::jmax(1, (int) (area.getHeight() / juce::jmax(1.0f, font.getHeight())));

        g.drawFittedText(layer.text, area, justificationFor(layer.textAlign), maxLines, 0.7f);
    }

    return image;
}

juce::Image ClipSynthesizer::renderShape(const RenderTypes::Layer& layer, int width, int height)
{
    auto image = ClipOps::createBlankFrame(width, height);

    {
        juce::Graphics g(image);
        g.setColour(VarHelpers::parseColour(juce::var(layer.fillColour), juce::Colour(0xff3b82f6)));

        const auto bounds = image.getBounds().toFloat();
        const auto shape = layer.shape.trim().toLowerCase();

        if (shape == "circle" || shape == "ellipse")
        {
            g.fillEllipse(bounds);
        }
        else if (shape == "rounded_rectangle" || layer.cornerRadius > 0.0f)
        {
            const float radius = layer.cornerRadius > 0.0f ? layer.cornerRadius
                                                           : juce::jmin(bounds.getWidth(), bounds.getHeight()) * 0.1f;
            g.fillRoundedRectangle(bounds, radius);
        }
        else
        {
            g.fillAll();
        }
    }

    return image;
}

//==============================================================================
Clip ClipSynthesizer::synthesize(const RenderTypes::Layer& layer, const std::vector<RenderTypes::EffectSpec>& effects)
{
    if (!layer.hasDuration())
    {
        log("WARNING: Layer '" + layer.id + "' has no duration and is skipped");
        return {};
    }

    const auto bounds = layerBounds(layer, canvasWidth, canvasHeight);
    auto clip = synthesizeContent(layer, bounds.getWidth(), bounds.getHeight());

    if (layer.opacity < 1.0)
    {
        const auto opacity = (float) juce::jlimit(0.0, 1.0, layer.opacity);
        const auto source = clip.frameAt;

        if (clip.animated)
        {
            clip.frameAt = [source, opacity](double t) { return ClipOps::withOpacity(source(t), opacity); };
        }
        else
        {
            const auto frame = ClipOps::withOpacity(source(0.0), opacity);
            clip.frameAt = [frame](double) { return frame; };
        }
    }

    if (layer.fade.enabled)
        clip = pipeline.apply(clip, "fade", fadeParams(layer.fade));

    for (const auto& effect : effects)
    {
        if (effect.isGlobal() || !layer.matchesTarget(effect.targetLayerId))
            continue;

        if (effect.type == "transition")
        {
            log("WARNING: Transition targeted at layer '" + layer.id + "' ignored; transitions join base clips");
            continue;
        }

        clip = pipeline.apply(clip, effect.type, effect.params);
    }

    return clip;
}

Clip ClipSynthesizer::synthesizeContent(const RenderTypes::Layer& layer, int width, int height)
{
    using RenderTypes::LayerType;

    switch (layer.type)
    {
        case LayerType::Text:
            return ClipOps::createStill(renderText(layer, width, height), layer.duration);

        case LayerType::Shape:
            return ClipOps::createStill(renderShape(layer, width, height), layer.duration);

        case LayerType::Image:
        case LayerType::Video:
        case LayerType::Mixed:
        default:
            break;
    }

    juce::File localFile;
    const auto fetched = fetcher.fetch(layer.source, localFile);
    if (fetched.failed())
    {
        log("WARNING: " + fetched.getErrorMessage() + " (layer '" + layer.id + "'), using placeholder");
        return createPlaceholder(width, height, layer.duration);
    }

    const bool isVideo = layer.type == LayerType::Video
                         || (layer.type == LayerType::Mixed && RenderTypes::looksLikeVideoUrl(layer.source));

    return isVideo ? loadVideoClip(localFile, width, height, layer.duration)
                   : loadImageClip(localFile, width, height, layer.duration);
}

//==============================================================================
juce::Image ClipSynthesizer::decodeImage(const juce::File& file)
{
    auto image = juce::ImageFileFormat::loadFrom(file);
    if (image.isValid())
        return image;

    // Formats JUCE cannot read (WebP, TIFF, ...) are converted to PNG first
    if (!workDirectory.isDirectory())
        workDirectory.createDirectory();

    const auto converted = workDirectory.getChildFile("image_" + juce::String(++decodeCounter) + ".png");
    if (ffmpeg.execute({ "-y", "-i", file.getFullPathName(), "-frames:v", "1", converted.getFullPathName() }))
        image = juce::ImageFileFormat::loadFrom(converted);

    return image;
}

Clip ClipSynthesizer::loadImageClip(const juce::File& file, int width, int height, double duration)
{
    const auto image = decodeImage(file);
    if (!image.isValid())
    {
        log("WARNING: Could not decode image " + file.getFileName() + ", using placeholder");
        return createPlaceholder(width, height, duration);
    }

    return ClipOps::createStill(ClipOps::coverToSize(image, width, height), duration);
}

Clip ClipSynthesizer::loadVideoClip(const juce::File& file, int width, int height, double duration)
{
    const auto framesDirectory = workDirectory.getChildFile("video_" + juce::String(++decodeCounter));
    if (!framesDirectory.createDirectory().wasOk())
    {
        log("WARNING: Cannot create " + framesDirectory.getFullPathName() + ", using placeholder");
        return createPlaceholder(width, height, duration);
    }

    // Scale to cover the box and crop the centre; even sizes keep the scaler happy
    const int scaledWidth = width + (width % 2);
    const int scaledHeight = height + (height % 2);
    const auto filter = "fps=" + juce::String(fps, 3)
                        + ",scale=" + juce::String(scaledWidth) + ":" + juce::String(scaledHeight)
                        + ":force_original_aspect_ratio=increase"
                        + ",crop=" + juce::String(scaledWidth) + ":" + juce::String(scaledHeight);

    // -stream_loop repeats a short source, -t trims a long one
    const juce::StringArray args { "-y",
                                   "-stream_loop", "-1",
                                   "-i", file.getFullPathName(),
                                   "-t", juce::String(duration, 3),
                                   "-an",
                                   "-vf", filter,
                                   "-q:v", "3",
                                   framesDirectory.getChildFile("frame_%05d.jpg").getFullPathName() };

    if (!ffmpeg.execute(args, duration))
    {
        log("WARNING: Could not decode video " + file.getFileName() + ", using placeholder");
        return createPlaceholder(width, height, duration);
    }

    const int frameCount = framesDirectory.getNumberOfChildFiles(juce::File::findFiles, "frame_*.jpg");
    if (frameCount == 0)
    {
        log("WARNING: Video " + file.getFileName() + " produced no frames, using placeholder");
        return createPlaceholder(width, height, duration);
    }

    log("Decoded " + juce::String(frameCount) + " frames from " + file.getFileName());

    auto sequence = std::make_shared<VideoFrameSequence>(framesDirectory, frameCount, fps, width, height);

    Clip clip;
    clip.width = width;
    clip.height = height;
    clip.duration = duration;
    clip.animated = true;
    clip.containsVideo = true;
    clip.frameAt = [sequence](double t) { return sequence->frameAt(t); };
    return clip;
}

//==============================================================================
juce::Result ClipSynthesizer::loadBackground(const juce::File& file, double duration, Clip& clip)
{
    if (!file.existsAsFile())
        return juce::Result::fail("Background clip not found: " + file.getFullPathName());

    if (RenderTypes::looksLikeVideoUrl(file.getFullPathName()))
    {
        clip = loadVideoClip(file, canvasWidth, canvasHeight, duration);
        if (!clip.containsVideo)
            return juce::Result::fail("Background clip could not be decoded: " + file.getFileName());
        return juce::Result::ok();
    }

    const auto image = decodeImage(file);
    if (!image.isValid())
        return juce::Result::fail("Background image could not be decoded: " + file.getFileName());

    clip = ClipOps::createStill(ClipOps::coverToSize(image, canvasWidth, canvasHeight), duration);
    return juce::Result::ok();
}

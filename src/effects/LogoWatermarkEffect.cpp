#include "LogoWatermarkEffect.h"
#include "../utils/VarHelpers.h"

namespace
{
    juce::String readPosition(const juce::var& params)
    {
        return VarHelpers::getString(params, "position", "bottom-right").trim().toLowerCase().replace("_", "-");
    }

    juce::File readLogoFile(const juce::var& params)
    {
        const auto path = VarHelpers::getString(params, "logo_path");
        return juce::File::isAbsolutePath(path) ? juce::File(path) : juce::File();
    }
}

const juce::StringArray& LogoWatermarkEffect::getPositions()
{
    static const juce::StringArray positions { "top-left", "top-center", "top-right",
                                               "center-left", "center", "center-right",
                                               "bottom-left", "bottom-center", "bottom-right" };
    return positions;
}

juce::Rectangle<int> LogoWatermarkEffect::computePlacement(int frameWidth, int frameHeight,
                                                           int logoWidth, int logoHeight,
                                                           const juce::String& position,
                                                           double scale, int margin)
{
    if (frameWidth <= 0 || frameHeight <= 0 || logoWidth <= 0 || logoHeight <= 0)
        return {};

    const double aspect = (double) logoHeight / (double) logoWidth;
    double width = juce::jlimit(0.01, 0.5, scale) * frameWidth;
    double height = width * aspect;

    const double maxHeight = frameHeight * 0.3;
    if (height > maxHeight)
    {
        height = maxHeight;
        width = height / aspect;
    }

    const int w = juce::jmax(1, juce::roundToInt(width));
    const int h = juce::jmax(1, juce::roundToInt(height));

    int x = frameWidth - w - margin;
    if (position.endsWith("left"))
        x = margin;
    else if (position == "center" || position.endsWith("-center"))
        x = (frameWidth - w) / 2;

    int y = frameHeight - h - margin;
    if (position.startsWith("top"))
        y = margin;
    else if (position.startsWith("center"))
        y = (frameHeight - h) / 2;

    return { x, y, w, h };
}

//==============================================================================
juce::Result LogoWatermarkEffect::checkParams(const juce::var& params) const
{
    const auto logoFile = readLogoFile(params);
    if (!logoFile.existsAsFile())
        return juce::Result::fail("Logo file not found: " + VarHelpers::getString(params, "logo_path"));

    const auto position = readPosition(params);
    if (!getPositions().contains(position))
        return juce::Result::fail("Unknown logo position '" + position + "'");

    const double opacity = VarHelpers::getDouble(params, "opacity", 0.7);
    if (opacity < 0.0 || opacity > 1.0)
        return juce::Result::fail("Logo opacity must be between 0 and 1");

    if (VarHelpers::getDouble(params, "scale", 0.15) <= 0.0)
        return juce::Result::fail("Logo scale must be positive");

    return juce::Result::ok();
}

EffectOutcome LogoWatermarkEffect::apply(const Clip& clip, const juce::var& params) const
{
    if (!clip.isValid())
        return EffectOutcome::failure("logo_watermark needs a non-empty clip");

    const auto logo = juce::ImageFileFormat::loadFrom(readLogoFile(params));
    if (!logo.isValid())
        return EffectOutcome::failure("Could not decode logo image");

    const auto position = readPosition(params);
    const auto opacity = (float) juce::jlimit(0.0, 1.0, VarHelpers::getDouble(params, "opacity", 0.7));
    const double scale = VarHelpers::getDouble(params, "scale", 0.15);
    const int margin = VarHelpers::getInt(params, "margin", 20);
    const auto source = clip.frameAt;

    auto result = clip;
    result.frameAt = [source, logo, position, opacity, scale, margin](double t)
    {
        const auto base = source(t);
        const auto bounds = computePlacement(base.getWidth(), base.getHeight(),
                                             logo.getWidth(), logo.getHeight(),
                                             position, scale, margin);

        auto frame = base.convertedToFormat(juce::Image::ARGB).createCopy();
        {
            juce::Graphics g(frame);
            g.setOpacity(opacity);
            g.setImageResamplingQuality(juce::Graphics::highResamplingQuality);
            g.drawImage(logo, bounds.toFloat(), juce::RectanglePlacement::stretchToFit);
        }
        return frame;
    };

    // A watermark on a still is still a still
    if (!clip.animated)
    {
        const auto frame = result.frameAt(0.0);
        result.frameAt = [frame](double) { return frame; };
    }

    return EffectOutcome::success(result);
}

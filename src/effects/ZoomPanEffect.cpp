#include "ZoomPanEffect.h"
#include "../utils/VarHelpers.h"

const juce::StringArray& ZoomPanEffect::getPanStyles()
{
    static const juce::StringArray styles { "left_to_right", "right_to_left",
                                            "top_to_bottom", "bottom_to_top",
                                            "zoom_center",
                                            "diagonal_tl_br", "diagonal_tr_bl" };
    return styles;
}

ZoomPanEffect::Easing ZoomPanEffect::easingFromString(const juce::String& name)
{
    const auto lower = name.trim().toLowerCase();

    if (lower == "ease_in" || lower == "quadratic_in")         return Easing::QuadraticIn;
    if (lower == "ease_out" || lower == "quadratic_out")       return Easing::QuadraticOut;
    if (lower == "ease_in_out" || lower == "quadratic_in_out") return Easing::QuadraticInOut;

    return Easing::Linear;
}

double ZoomPanEffect::ease(Easing easing, double t)
{
    t = juce::jlimit(0.0, 1.0, t);

    switch (easing)
    {
        case Easing::QuadraticIn:    return t * t;
        case Easing::QuadraticOut:   return t * (2.0 - t);
        case Easing::QuadraticInOut: return t < 0.5 ? 2.0 * t * t
                                                    : 1.0 - std::pow(-2.0 * t + 2.0, 2.0) / 2.0;
        case Easing::Linear:         break;
    }

    return t;
}

ZoomPanEffect::Window ZoomPanEffect::computeWindow(double t, double duration,
                                                   double zoomStart, double zoomEnd,
                                                   const juce::String& panStyle, Easing easing,
                                                   int width, int height)
{
    const double progress = ease(easing, duration > 0.0 ? t / duration : 0.0);

    Window window;
    window.zoom = zoomStart + (zoomEnd - zoomStart) * progress;
    window.scaledWidth = juce::jmax(1, (int) std::floor(width * window.zoom));
    window.scaledHeight = juce::jmax(1, (int) std::floor(height * window.zoom));

    const int slackX = juce::jmax(0, window.scaledWidth - width);
    const int slackY = juce::jmax(0, window.scaledHeight - height);

    int x = slackX / 2;
    int y = slackY / 2;

    if (panStyle == "left_to_right")       { x = (int) (slackX * progress); }
    else if (panStyle == "right_to_left")  { x = (int) (slackX * (1.0 - progress)); }
    else if (panStyle == "top_to_bottom")  { y = (int) (slackY * progress); }
    else if (panStyle == "bottom_to_top")  { y = (int) (slackY * (1.0 - progress)); }
    else if (panStyle == "diagonal_tl_br") { x = (int) (slackX * progress);         y = (int) (slackY * progress); }
    else if (panStyle == "diagonal_tr_bl") { x = (int) (slackX * (1.0 - progress)); y = (int) (slackY * progress); }

    x = juce::jlimit(0, slackX, x);
    y = juce::jlimit(0, slackY, y);

    window.crop = juce::Rectangle<int>(x, y,
                                       juce::jmin(width, window.scaledWidth),
                                       juce::jmin(height, window.scaledHeight));
    return window;
}

//==============================================================================
juce::Result ZoomPanEffect::checkParams(const juce::var& params) const
{
    const double zoomStart = VarHelpers::getDouble(params, "zoom_start", 1.0);
    const double zoomEnd = VarHelpers::getDouble(params, "zoom_end", 1.2);

    if (zoomStart <= 0.0 || zoomEnd <= 0.0)
        return juce::Result::fail("Zoom levels must be positive");

    return juce::Result::ok();
}

juce::StringArray ZoomPanEffect::getParamWarnings(const juce::var& params) const
{
    juce::StringArray warnings;

    const auto panStyle = VarHelpers::getString(params, "pan_style", "random");
    if (panStyle != "random" && !getPanStyles().contains(panStyle))
        warnings.add("Unknown pan style '" + panStyle + "', using a random style");

    return warnings;
}

EffectOutcome ZoomPanEffect::apply(const Clip& clip, const juce::var& params) const
{
    if (!clip.isValid())
        return EffectOutcome::failure("zoom_pan needs a non-empty clip");

    const double zoomStart = VarHelpers::getDouble(params, "zoom_start", 1.0);
    const double zoomEnd = VarHelpers::getDouble(params, "zoom_end", 1.2);
    const auto easing = easingFromString(VarHelpers::getString(params, "easing", "linear"));

    auto panStyle = VarHelpers::getString(params, "pan_style", "random");
    if (!getPanStyles().contains(panStyle))
        panStyle = getPanStyles()[juce::Random::getSystemRandom().nextInt(getPanStyles().size())];

    const double duration = VarHelpers::getDouble(params, "duration", clip.duration);
    const int width = clip.width;
    const int height = clip.height;
    const auto source = clip.frameAt;

    auto result = clip;
    result.animated = true;
    result.frameAt = [=](double t)
    {
        const auto window = computeWindow(juce::jmin(t, duration), duration, zoomStart, zoomEnd,
                                          panStyle, easing, width, height);

        const auto scaled = source(t).rescaled(window.scaledWidth, window.scaledHeight,
                                               juce::Graphics::mediumResamplingQuality);

        const int drawX = window.scaledWidth >= width ? -window.crop.getX() : (width - window.scaledWidth) / 2;
        const int drawY = window.scaledHeight >= height ? -window.crop.getY() : (height - window.scaledHeight) / 2;

        auto frame = ClipOps::createBlankFrame(width, height);
        {
            juce::Graphics g(frame);
            g.drawImageAt(scaled, drawX, drawY);
        }
        return frame;
    };

    return EffectOutcome::success(result);
}

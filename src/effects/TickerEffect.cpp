#include "TickerEffect.h"
#include "../utils/VarHelpers.h"

namespace
{
    constexpr double bannerFadeSeconds = 0.5;
    constexpr int wrapPadding = 40;
    constexpr int outlineWidth = 2;

    juce::String readSummary(const juce::var& params)
    {
        return VarHelpers::getString(params, "summary", VarHelpers::getString(params, "ticker_text")).trim();
    }

    juce::Font makeFont(float size, bool bold)
    {
        return juce::Font(juce::Font::getDefaultSansSerifFontName(), size,
                          bold ? juce::Font::bold : juce::Font::plain);
    }

    juce::Image renderBanner(int width, int height, const juce::String& heading,
                             juce::Colour background, juce::Colour textColour, float fontSize)
    {
        const auto font = makeFont(fontSize, true);
        const auto lines = TickerEffect::wrapText(heading, font, (float) (width - wrapPadding));
        const auto lineHeight = (int) std::ceil(font.getHeight());
        const int textTop = (height - lineHeight * lines.size()) / 2;
        const auto outline = textColour == juce::Colours::white ? juce::Colours::black : juce::Colours::white;

        juce::Image banner(juce::Image::ARGB, width, height, true);
        {
            juce::Graphics g(banner);
            g.fillAll(background);
            g.setFont(font);

            for (int i = 0; i < lines.size(); ++i)
            {
                const juce::Rectangle<int> row(0, textTop + i * lineHeight, width, lineHeight);

                g.setColour(outline);
                for (int dx = -outlineWidth; dx <= outlineWidth; ++dx)
                    for (int dy = -outlineWidth; dy <= outlineWidth; ++dy)
                        if (dx != 0 || dy != 0)
                            g.drawText(lines[i], row.translated(dx, dy), juce::Justification::centred, false);

                g.setColour(textColour);
                g.drawText(lines[i], row, juce::Justification::centred, false);
            }
        }

        return banner;
    }

    // One strip holding enough repeats of the text to scroll across the canvas
    juce::Image renderTickerStrip(int canvasWidth, int height, const juce::String& unit, double unitWidth,
                                  juce::Colour textColour, float fontSize)
    {
        const int copies = TickerEffect::repeatCount(canvasWidth, unitWidth);
        const int stripWidth = juce::jmax(1, (int) std::ceil(unitWidth * copies));

        juce::Image strip(juce::Image::ARGB, stripWidth, height, true);

        {
            juce::Graphics g(strip);
            g.setFont(makeFont(fontSize, false));
            g.setColour(textColour);

            for (int i = 0; i < copies; ++i)
            {
                const auto x = (float) (i * unitWidth);
                g.drawText(unit, juce::Rectangle<float>(x, 0.0f, (float) unitWidth + 1.0f, (float) height),
                           juce::Justification::centredLeft, false);
            }
        }

        return strip;
    }
}

const juce::String TickerEffect::separator = juce::String::fromUTF8("  \xe2\x80\xa2  ");

double TickerEffect::scrollOffset(double t, double scrollSpeed, double textWidth)
{
    if (textWidth <= 0.0)
        return 0.0;

    const double offset = std::fmod(t * scrollSpeed, textWidth);
    return offset < 0.0 ? offset + textWidth : offset;
}

int TickerEffect::repeatCount(int canvasWidth, double textWidth)
{
    if (textWidth <= 0.0)
        return 1;

    return (int) std::ceil((double) canvasWidth / textWidth) + 1;
}

float TickerEffect::bannerOpacity(double t, double bannerDuration)
{
    if (t < 0.0 || t > bannerDuration)
        return 0.0f;

    double opacity = 1.0;
    if (t < bannerFadeSeconds)
        opacity = t / bannerFadeSeconds;
    if (t > bannerDuration - bannerFadeSeconds)
        opacity = juce::jmin(opacity, (bannerDuration - t) / bannerFadeSeconds);

    return (float) juce::jlimit(0.0, 1.0, opacity);
}

juce::StringArray TickerEffect::wrapText(const juce::String& text, const juce::Font& font, float maxWidth)
{
    juce::StringArray words;
    words.addTokens(text, " \t\r\n", {});
    words.removeEmptyStrings();

    juce::StringArray lines;
    juce::String current;

    for (const auto& word : words)
    {
        const auto candidate = current.isEmpty() ? word : current + " " + word;
        if (font.getStringWidthFloat(candidate) <= maxWidth || current.isEmpty())
        {
            current = candidate;
        }
        else
        {
            lines.add(current);
            current = word;
        }
    }

    if (current.isNotEmpty())
        lines.add(current);

    return lines;
}

//==============================================================================
juce::Result TickerEffect::checkParams(const juce::var& params) const
{
    const auto heading = VarHelpers::getString(params, "heading").trim();
    if (heading.isEmpty() && readSummary(params).isEmpty())
        return juce::Result::fail("ticker needs a heading or summary text");

    if (VarHelpers::getInt(params, "banner_height", 100) < 0 || VarHelpers::getInt(params, "ticker_height", 40) < 0)
        return juce::Result::fail("Banner and ticker heights cannot be negative");

    if (VarHelpers::getDouble(params, "font_size", 42.0) <= 0.0
        || VarHelpers::getDouble(params, "ticker_font_size", 24.0) <= 0.0)
        return juce::Result::fail("Font sizes must be positive");

    return juce::Result::ok();
}

EffectOutcome TickerEffect::apply(const Clip& clip, const juce::var& params) const
{
    if (!clip.isValid())
        return EffectOutcome::failure("ticker needs a non-empty clip");

    const auto heading = VarHelpers::getString(params, "heading").trim();
    const auto summary = readSummary(params);
    const auto textColour = VarHelpers::getColour(params, "text_color", juce::Colours::white);
    const double scrollSpeed = VarHelpers::getDouble(params, "scroll_speed", 120.0);
    const double bannerDuration = juce::jmin(clip.duration, VarHelpers::getDouble(params, "banner_duration", clip.duration));

    const int width = clip.width;
    const int tickerHeight = summary.isEmpty() ? 0 : juce::jmin(clip.height, VarHelpers::getInt(params, "ticker_height", 40));
    const int bannerHeight = heading.isEmpty() ? 0 : juce::jmin(clip.height - tickerHeight,
                                                                VarHelpers::getInt(params, "banner_height", 100));
    const int tickerTop = clip.height - tickerHeight;
    const int bannerTop = tickerTop - bannerHeight;

    juce::Image banner;
    if (bannerHeight > 0)
        banner = renderBanner(width, bannerHeight, heading,
                              VarHelpers::getColour(params, "banner_color", juce::Colour(0, 51, 153)),
                              textColour, (float) VarHelpers::getDouble(params, "font_size", 42.0));

    juce::Image strip;
    double unitWidth = 0.0;
    const auto tickerColour = VarHelpers::getColour(params, "ticker_color", juce::Colour(20, 20, 20));

    if (tickerHeight > 0)
    {
        const auto fontSize = (float) VarHelpers::getDouble(params, "ticker_font_size", 24.0);
        const auto unit = summary + separator;
        unitWidth = juce::jmax(1.0, (double) makeFont(fontSize, false).getStringWidthFloat(unit));
        strip = renderTickerStrip(width, tickerHeight, unit, unitWidth, textColour, fontSize);
    }

    const auto source = clip.frameAt;

    auto result = clip;
    result.animated = clip.animated || tickerHeight > 0 || bannerHeight > 0;
    result.frameAt = [=](double t)
    {
        auto frame = source(t).convertedToFormat(juce::Image::ARGB).createCopy();
        {
            juce::Graphics g(frame);

            if (bannerHeight > 0)
            {
                const auto opacity = bannerOpacity(t, bannerDuration);
                if (opacity > 0.0f)
                {
                    g.setOpacity(opacity);
                    g.drawImageAt(banner, 0, bannerTop);
                    g.setOpacity(1.0f);
                }
            }

            if (tickerHeight > 0)
            {
                g.setColour(tickerColour);
                g.fillRect(0, tickerTop, width, tickerHeight);

                const auto offset = scrollOffset(t, scrollSpeed, unitWidth);
                g.drawImageAt(strip, -(int) std::round(offset), tickerTop);
            }
        }
        return frame;
    };

    return EffectOutcome::success(result);
}

#pragma once
#include <JuceHeader.h>
#include <map>
#include <vector>

/**
 * Typed view of a resolved video template.
 *
 * A template is a tree of timed layers plus a list of effects and the
 * variable declarations its string fields refer to. The JSON document is
 * first passed through the VariableResolver and then parsed into these
 * structs by the TemplateParser.
 */
namespace RenderTypes
{
    /** The kind of visual element a layer renders to */
    enum class LayerType
    {
        Image,
        Video,
        Text,
        Shape,
        Mixed       // array layers whose assets may be images or videos
    };

    /** Declared type of a template variable, used to pick defaults */
    enum class VarType
    {
        Text,
        Color,
        Image,
        Video,
        Number,
        Url,
        Audio,
        Font,
        Other
    };

    struct VarSpec
    {
        VarType type = VarType::Text;
        juce::var defaultValue;     // void when the template declares no default
        bool required = false;
        juce::String description;

        bool hasDefault() const { return !defaultValue.isVoid(); }
    };

    struct FadeSpec
    {
        bool enabled = false;
        double fadeIn = 0.5;
        double fadeOut = 0.5;
        juce::String type = "both";  // "in", "out" or "both"
    };

    struct Layer
    {
        juce::String id;
        juce::String expandedFrom;  // id of the array layer this layer came from, if any
        LayerType type = LayerType::Image;

        juce::String source;
        juce::StringArray sources;  // populated for expandable layers
        bool hasArraySource = false;

        // Position and size are fractions of the canvas
        double x = 0.0;
        double y = 0.0;
        double width = 1.0;
        double height = 1.0;

        double startTime = 0.0;
        double duration = -1.0;     // <= 0 means "until the end of the timeline"
        int zIndex = 0;
        double opacity = 1.0;
        FadeSpec fade;

        // Text layers
        juce::String text;
        juce::String fontFamily = "Arial";
        float fontSize = 48.0f;
        juce::String textColour = "#FFFFFF";
        juce::String backgroundColour;
        juce::String textAlign = "center";
        bool bold = false;

        // Shape layers
        juce::String shape = "rectangle";
        juce::String fillColour = "#3B82F6";
        float cornerRadius = 0.0f;

        bool hasDuration() const { return duration > 0.0; }
        bool isExpandable() const { return hasArraySource; }
        bool isMedia() const      { return type == LayerType::Image || type == LayerType::Video || type == LayerType::Mixed; }
        double endTime() const { return startTime + juce::jmax(0.0, duration); }

        /** True if an effect addressed to targetId applies to this layer. */
        bool matchesTarget(const juce::String& targetId) const
        {
            return targetId.isNotEmpty() && (id == targetId || expandedFrom == targetId);
        }
    };

    struct EffectSpec
    {
        juce::String type;
        juce::var params;
        juce::String targetLayerId;

        bool isGlobal() const { return targetLayerId.isEmpty(); }
    };

    struct Template
    {
        juce::String templateId;
        juce::String name;
        juce::String aspectRatio = "16:9";
        int width = 1920;
        int height = 1080;

        std::vector<Layer> layers;
        std::vector<EffectSpec> effects;
        std::map<juce::String, VarSpec> variables;

        juce::var backgroundMusic;
        juce::var logo;
    };

    //==============================================================================
    juce::String layerTypeToString(LayerType type);

    /** Parses a layer type name. Returns false for unknown names. */
    bool parseLayerType(const juce::String& name, LayerType& result);

    VarType varTypeFromString(const juce::String& name);

    /** Guesses whether a URL refers to a video from its file extension. */
    bool looksLikeVideoUrl(const juce::String& url);
}

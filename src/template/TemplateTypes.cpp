#include "TemplateTypes.h"

namespace RenderTypes
{
    juce::String layerTypeToString(LayerType type)
    {
        switch (type)
        {
            case LayerType::Image: return "image";
            case LayerType::Video: return "video";
            case LayerType::Text:  return "text";
            case LayerType::Shape: return "shape";
            case LayerType::Mixed: return "mixed";
        }

        return "image";
    }

    bool parseLayerType(const juce::String& name, LayerType& result)
    {
        const auto lower = name.trim().toLowerCase();

        if (lower == "image")      { result = LayerType::Image; return true; }
        if (lower == "video")      { result = LayerType::Video; return true; }
        if (lower == "text")       { result = LayerType::Text;  return true; }
        if (lower == "shape")      { result = LayerType::Shape; return true; }
        if (lower == "mixed")      { result = LayerType::Mixed; return true; }

        return false;
    }

    VarType varTypeFromString(const juce::String& name)
    {
        const auto lower = name.trim().toLowerCase();

        if (lower == "text" || lower == "string") return VarType::Text;
        if (lower == "color" || lower == "colour") return VarType::Color;
        if (lower == "image")  return VarType::Image;
        if (lower == "video")  return VarType::Video;
        if (lower == "number") return VarType::Number;
        if (lower == "url")    return VarType::Url;
        if (lower == "audio")  return VarType::Audio;
        if (lower == "font")   return VarType::Font;

        return VarType::Other;
    }

    bool looksLikeVideoUrl(const juce::String& url)
    {
        static const juce::StringArray videoExtensions { ".mp4", ".mov", ".webm", ".mkv", ".avi", ".m4v" };

        auto path = url.upToFirstOccurrenceOf("?", false, false)
                       .upToFirstOccurrenceOf("#", false, false)
                       .toLowerCase();

        for (const auto& extension : videoExtensions)
            if (path.endsWith(extension))
                return true;

        return false;
    }
}

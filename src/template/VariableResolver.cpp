#include "VariableResolver.h"
#include "../utils/VarHelpers.h"

namespace
{
    const juce::Identifier variablesId ("variables");

    bool isWordCharacter(juce::juce_wchar c)
    {
        return juce::CharacterFunctions::isLetterOrDigit(c) || c == '_';
    }

    bool isValidName(const juce::String& name)
    {
        if (name.isEmpty())
            return false;

        for (auto p = name.getCharPointer(); !p.isEmpty(); ++p)
            if (!isWordCharacter(*p))
                return false;

        return true;
    }

    /** A {{name}} token located in a string. */
    struct Token
    {
        int start = -1;
        int end = -1;       // one past the closing braces
        juce::String name;
    };

    // Finds the next well-formed token at or after 'from'. Malformed braces are skipped.
    bool findNextToken(const juce::String& text, int from, Token& token)
    {
        int open = text.indexOf(from, "{{");

        while (open >= 0)
        {
            const int close = text.indexOf(open + 2, "}}");
            if (close < 0)
                return false;

            const auto name = text.substring(open + 2, close);
            if (isValidName(name))
            {
                token.start = open;
                token.end = close + 2;
                token.name = name;
                return true;
            }

            open = text.indexOf(open + 1, "{{");
        }

        return false;
    }

    juce::String valueAsText(const juce::var& value)
    {
        if (value.isArray() || value.isObject())
            return juce::JSON::toString(value, true);
        return value.toString();
    }

    void collectPlaceholders(const juce::var& value, juce::StringArray& names)
    {
        if (value.isString())
        {
            const auto text = value.toString();
            Token token;
            int position = 0;

            while (findNextToken(text, position, token))
            {
                names.addIfNotAlreadyThere(token.name);
                position = token.end;
            }
        }
        else if (auto* array = value.getArray())
        {
            for (const auto& element : *array)
                collectPlaceholders(element, names);
        }
        else if (auto* object = value.getDynamicObject())
        {
            for (const auto& property : object->getProperties())
                collectPlaceholders(property.value, names);
        }
    }

    RenderTypes::VarSpec parseSpec(const juce::var& specValue)
    {
        RenderTypes::VarSpec spec;

        if (!specValue.isObject())
        {
            // Shorthand: "title": "text"
            if (specValue.isString())
                spec.type = RenderTypes::varTypeFromString(specValue.toString());
            return spec;
        }

        spec.type = RenderTypes::varTypeFromString(VarHelpers::getString(specValue, "type", "text"));
        spec.required = VarHelpers::getBool(specValue, "required", false);
        spec.description = VarHelpers::getString(specValue, "description");

        if (VarHelpers::has(specValue, "default"))
            spec.defaultValue = specValue["default"].clone();
        else if (VarHelpers::has(specValue, "default_value"))
            spec.defaultValue = specValue["default_value"].clone();

        return spec;
    }
}

//==============================================================================
void VariableResolver::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

//==============================================================================
juce::var VariableResolver::resolve(const juce::var& templateDocument, const juce::var& variables) const
{
    const auto specs = parseVariableSpecs(templateDocument);
    const Lookup lookup { variables, specs };

    return resolveValue(templateDocument, lookup, true);
}

juce::var VariableResolver::resolveValue(const juce::var& value, const Lookup& lookup, bool isRoot) const
{
    if (value.isString())
        return resolveString(value.toString(), lookup);

    if (auto* array = value.getArray())
    {
        juce::Array<juce::var> resolved;
        for (const auto& element : *array)
            resolved.add(resolveValue(element, lookup, false));
        return resolved;
    }

    if (auto* object = value.getDynamicObject())
    {
        auto* copy = new juce::DynamicObject();
        juce::var result (copy);

        for (const auto& property : object->getProperties())
        {
            // Declarations are kept as written so the document can be resolved again
            if (isRoot && property.name == variablesId)
                copy->setProperty(property.name, property.value.clone());
            else
                copy->setProperty(property.name, resolveValue(property.value, lookup, false));
        }

        return result;
    }

    return value.clone();
}

juce::var VariableResolver::resolveString(const juce::String& text, const Lookup& lookup) const
{
    Token token;
    if (!findNextToken(text, 0, token))
        return text;

    // Whole-string token keeps the value's JSON type
    if (token.start == 0 && token.end == text.length())
    {
        juce::var value;
        if (findValue(token.name, lookup, value))
            return value.clone();

        if (logCallback)
            logCallback("WARNING: Unresolved template variable '" + token.name + "'");
        return text;
    }

    juce::String result;
    int position = 0;

    do
    {
        result += text.substring(position, token.start);

        juce::var value;
        if (findValue(token.name, lookup, value))
        {
            result += valueAsText(value);
        }
        else
        {
            result += text.substring(token.start, token.end);
            if (logCallback)
                logCallback("WARNING: Unresolved template variable '" + token.name + "'");
        }

        position = token.end;
    }
    while (findNextToken(text, position, token));

    result += text.substring(position);
    return result;
}

bool VariableResolver::findValue(const juce::String& name, const Lookup& lookup, juce::var& result) const
{
    const juce::Identifier key (name);

    if (VarHelpers::has(lookup.variables, key))
    {
        result = lookup.variables[key];
        return true;
    }

    const auto spec = lookup.specs.find(name);
    if (spec == lookup.specs.end())
        return false;

    if (spec->second.hasDefault())
    {
        result = spec->second.defaultValue;
        return true;
    }

    result = placeholderFor(spec->second.type);
    return true;
}

//==============================================================================
juce::StringArray VariableResolver::extractPlaceholders(const juce::var& document)
{
    juce::StringArray names;

    if (auto* object = document.getDynamicObject())
    {
        for (const auto& property : object->getProperties())
            if (property.name != variablesId)
                collectPlaceholders(property.value, names);
    }
    else
    {
        collectPlaceholders(document, names);
    }

    return names;
}

std::map<juce::String, RenderTypes::VarSpec> VariableResolver::parseVariableSpecs(const juce::var& templateDocument)
{
    std::map<juce::String, RenderTypes::VarSpec> specs;
    const auto declarations = VarHelpers::get(templateDocument, variablesId);

    if (auto* object = declarations.getDynamicObject())
    {
        for (const auto& property : object->getProperties())
            specs[property.name.toString()] = parseSpec(property.value);
    }
    else if (auto* array = declarations.getArray())
    {
        for (const auto& entry : *array)
        {
            const auto name = VarHelpers::getString(entry, "name");
            if (name.isNotEmpty())
                specs[name] = parseSpec(entry);
        }
    }

    return specs;
}

juce::StringArray VariableResolver::findMissingRequired(const juce::var& templateDocument, const juce::var& variables)
{
    juce::StringArray missing;

    for (const auto& entry : parseVariableSpecs(templateDocument))
    {
        const auto& spec = entry.second;
        if (spec.required && !spec.hasDefault() && !VarHelpers::has(variables, juce::Identifier(entry.first)))
            missing.add(entry.first);
    }

    return missing;
}

juce::var VariableResolver::mergeOverrides(const juce::var& defaults, const juce::var& overrides)
{
    auto merged = defaults.isObject() ? defaults.clone() : VarHelpers::makeObject();

    auto* overrideObject = overrides.getDynamicObject();
    if (overrideObject == nullptr)
        return merged;

    for (const auto& property : overrideObject->getProperties())
    {
        const auto existing = VarHelpers::get(merged, property.name);

        if (existing.isObject() && property.value.isObject())
            VarHelpers::set(merged, property.name, mergeOverrides(existing, property.value));
        else
            VarHelpers::set(merged, property.name, property.value.clone());
    }

    return merged;
}

juce::var VariableResolver::placeholderFor(RenderTypes::VarType type)
{
    using RenderTypes::VarType;

    switch (type)
    {
        case VarType::Text:   return "Sample Text";
        case VarType::Color:  return "#808080";
        case VarType::Image:  return juce::String();
        case VarType::Video:  return juce::String();
        case VarType::Number: return 1.0;
        case VarType::Url:    return "https://example.com";
        case VarType::Audio:  return juce::String();
        case VarType::Font:   return "Arial";
        case VarType::Other:  break;
    }

    return "Sample Value";
}

#pragma once
#include <JuceHeader.h>
#include "TemplateTypes.h"

/**
 * Substitutes {{name}} placeholders in a template document.
 *
 * Every string in the document (except the variable declarations themselves)
 * is scanned for tokens. A token is replaced by the caller's value when one is
 * supplied, otherwise by the declared default, otherwise by a placeholder
 * chosen from the declared type. Tokens naming undeclared variables with no
 * supplied value are left verbatim so later stages can apply their own
 * defaults.
 *
 * A string consisting of exactly one token takes the value with its JSON type
 * (so "{{images}}" can become an array). Tokens embedded in longer text are
 * replaced by the value's text.
 *
 * Resolution never fails and is idempotent: a document with no tokens left is
 * returned unchanged.
 */
class VariableResolver
{
public:
    VariableResolver() = default;

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Resolves all placeholders in a template document.
     *
     * @param templateDocument The parsed template JSON
     * @param variables        Object mapping variable names to values (may be void)
     * @return                 A deep copy of the document with tokens replaced
     */
    juce::var resolve(const juce::var& templateDocument, const juce::var& variables) const;

    /** Returns the distinct placeholder names used anywhere in the document, in order of appearance. */
    static juce::StringArray extractPlaceholders(const juce::var& document);

    /**
     * Reads the "variables" section of a template document. Both the object form
     * ({"title": {"type": "text"}}) and the array form ([{"name": "title", ...}])
     * are accepted.
     */
    static std::map<juce::String, RenderTypes::VarSpec> parseVariableSpecs(const juce::var& templateDocument);

    /** Returns the names of required variables that have neither a supplied value nor a default. */
    static juce::StringArray findMissingRequired(const juce::var& templateDocument, const juce::var& variables);

    /** Deep-merges override values into a copy of the defaults. Nested objects are merged key by key. */
    static juce::var mergeOverrides(const juce::var& defaults, const juce::var& overrides);

    /** The value used for a declared variable that has no supplied value and no default. */
    static juce::var placeholderFor(RenderTypes::VarType type);

private:
    struct Lookup
    {
        const juce::var& variables;
        const std::map<juce::String, RenderTypes::VarSpec>& specs;
    };

    juce::var resolveValue(const juce::var& value, const Lookup& lookup, bool isRoot) const;
    juce::var resolveString(const juce::String& text, const Lookup& lookup) const;
    bool findValue(const juce::String& name, const Lookup& lookup, juce::var& result) const;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(VariableResolver)
};

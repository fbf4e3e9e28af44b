#include "EffectsPipeline.h"

EffectsPipeline::EffectsPipeline(const EffectRegistry& registryToUse)
    : registry(registryToUse)
{
}

void EffectsPipeline::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void EffectsPipeline::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

//==============================================================================
EffectOutcome EffectsPipeline::tryApply(const Clip& clip, const juce::String& effectName, const juce::var& params) const
{
    auto effect = registry.create(effectName);
    if (effect == nullptr)
        return EffectOutcome::failure("Unknown effect '" + effectName + "'");

    const auto check = effect->checkParams(params);
    if (check.failed())
        return EffectOutcome::failure(effectName + ": " + check.getErrorMessage());

    for (const auto& warning : effect->getParamWarnings(params))
        log("WARNING: " + effectName + ": " + warning);

    try
    {
        return effect->apply(clip, params);
    }
    catch (const std::exception& e)
    {
        return EffectOutcome::failure(effectName + " threw: " + juce::String(e.what()));
    }
}

Clip EffectsPipeline::apply(const Clip& clip, const juce::String& effectName, const juce::var& params) const
{
    const auto outcome = tryApply(clip, effectName, params);

    if (outcome.failed())
        log("WARNING: Effect skipped, " + outcome.getErrorMessage());

    return outcome.orElse(clip);
}

Clip EffectsPipeline::applyAll(const Clip& clip, const std::vector<RenderTypes::EffectSpec>& effects) const
{
    auto result = clip;

    for (const auto& spec : effects)
        result = apply(result, spec.type, spec.params);

    return result;
}

Clip EffectsPipeline::join(const Clip& first, const Clip& second, const juce::var& transitionParams) const
{
    auto transition = registry.create("transition");

    if (transition != nullptr && transition->isTransition())
    {
        const auto check = transition->checkParams(transitionParams);
        if (check.wasOk())
        {
            for (const auto& warning : transition->getParamWarnings(transitionParams))
                log("WARNING: transition: " + warning);

            const auto outcome = transition->join(first, second, transitionParams);
            if (outcome.wasOk())
                return outcome.getClip();

            log("WARNING: Transition failed, " + outcome.getErrorMessage());
        }
        else
        {
            log("WARNING: Transition skipped, " + check.getErrorMessage());
        }
    }

    return ClipOps::concatenate(first, second);
}

bool EffectsPipeline::introducesMotion(const juce::String& effectName) const
{
    auto effect = registry.create(effectName);
    return effect != nullptr && effect->introducesMotion();
}

#include "AssetFetcher.h"

AssetFetcher::AssetFetcher(const juce::File& directory, int timeout)
    : cacheDirectory(directory),
      timeoutSeconds(juce::jmax(1, timeout))
{
}

void AssetFetcher::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

bool AssetFetcher::isRemote(const juce::String& reference)
{
    const auto trimmed = reference.trim();
    return trimmed.startsWithIgnoreCase("http://") || trimmed.startsWithIgnoreCase("https://");
}

juce::String AssetFetcher::extensionOf(const juce::String& reference)
{
    auto path = reference.trim().upToFirstOccurrenceOf("?", false, false)
                                .upToFirstOccurrenceOf("#", false, false);

    const auto name = path.fromLastOccurrenceOf("/", false, false);
    const int dot = name.lastIndexOfChar('.');
    if (dot <= 0 || name.length() - dot > 6)
        return {};

    return name.substring(dot).toLowerCase();
}

//==============================================================================
juce::Result AssetFetcher::fetch(const juce::String& reference, juce::File& localFile)
{
    const auto trimmed = reference.trim();
    if (trimmed.isEmpty())
        return juce::Result::fail("Empty asset reference");

    const auto cached = cache.find(trimmed);
    if (cached != cache.end())
    {
        localFile = cached->second;
        return juce::Result::ok();
    }

    juce::File resolved;

    if (trimmed.startsWithIgnoreCase("file://"))
    {
        resolved = juce::URL(trimmed).getLocalFile();
    }
    else if (isRemote(trimmed))
    {
        const auto result = download(trimmed, resolved);
        if (result.failed())
            return result;
    }
    else if (juce::File::isAbsolutePath(trimmed))
    {
        resolved = juce::File(trimmed);
    }
    else
    {
        return juce::Result::fail("Unsupported asset reference: " + trimmed);
    }

    if (!resolved.existsAsFile())
        return juce::Result::fail("Asset not found: " + trimmed);

    cache[trimmed] = resolved;
    localFile = resolved;
    return juce::Result::ok();
}

juce::Result AssetFetcher::download(const juce::String& url, juce::File& localFile)
{
    if (!cacheDirectory.isDirectory() && !cacheDirectory.createDirectory().wasOk())
        return juce::Result::fail("Cannot create download directory " + cacheDirectory.getFullPathName());

    int statusCode = 0;
    auto options = juce::URL::InputStreamOptions(juce::URL::ParameterHandling::inAddress)
                       .withConnectionTimeoutMs(timeoutSeconds * 1000)
                       .withStatusCode(&statusCode)
                       .withNumRedirectsToFollow(5);

    std::unique_ptr<juce::InputStream> stream (juce::URL(url).createInputStream(options));
    if (stream == nullptr)
        return juce::Result::fail("Download failed or timed out: " + url);

    if (statusCode != 0 && (statusCode < 200 || statusCode >= 300))
        return juce::Result::fail("Download of " + url + " returned HTTP " + juce::String(statusCode));

    const auto target = cacheDirectory.getChildFile("asset_" + juce::String(++downloadCounter) + extensionOf(url));

    {
        juce::FileOutputStream output(target);
        if (!output.openedOk())
            return juce::Result::fail("Cannot write " + target.getFullPathName());

        output.setPosition(0);
        output.truncate();

        if (output.writeFromInputStream(*stream, -1) <= 0)
            return juce::Result::fail("Empty download: " + url);

        output.flush();
    }

    if (logCallback)
        logCallback("Downloaded " + url + " (" + juce::String(target.getSize() / 1024) + " KB)");

    localFile = target;
    return juce::Result::ok();
}

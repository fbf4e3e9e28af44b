#pragma once
#include <JuceHeader.h>
#include <map>

/**
 * Resolves asset references to local files.
 *
 * Accepts absolute paths, file:// URLs and http(s) URLs. Remote assets are
 * downloaded once per render into the cache directory with a bounded
 * connection timeout; later requests for the same URL reuse the download.
 *
 * A failed fetch is reported through the returned Result so the caller can
 * substitute a placeholder and carry on.
 */
class AssetFetcher
{
public:
    /**
     * @param cacheDirectory  Where downloads are stored, normally inside the render's temp directory
     * @param timeoutSeconds  Connection timeout for each download
     */
    AssetFetcher(const juce::File& cacheDirectory, int timeoutSeconds);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Makes an asset available locally.
     *
     * @param reference  Path or URL of the asset
     * @param localFile  Receives the local file on success
     */
    juce::Result fetch(const juce::String& reference, juce::File& localFile);

    /** True for http:// and https:// references. */
    static bool isRemote(const juce::String& reference);

    /** File extension of a reference with any query string or fragment removed, e.g. ".png". */
    static juce::String extensionOf(const juce::String& reference);

private:
    juce::Result download(const juce::String& url, juce::File& localFile);

    juce::File cacheDirectory;
    int timeoutSeconds;
    int downloadCounter = 0;
    std::map<juce::String, juce::File> cache;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AssetFetcher)
};

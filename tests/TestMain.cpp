/*
  ==============================================================================
    TestMain.cpp - Runs the Storyreel unit tests
  ==============================================================================
*/

#include <JuceHeader.h>
#include <iostream>

namespace
{
    /** Prints test output to stdout instead of the debugger. */
    class ConsoleTestRunner : public juce::UnitTestRunner
    {
        void logMessage(const juce::String& message) override
        {
            std::cout << message << std::endl;
        }
    };
}

int main(int argc, char* argv[])
{
    juce::ArgumentList args(argc, argv);

    ConsoleTestRunner runner;
    runner.setAssertOnFailure(false);

    const auto category = args.getValueForOption("--category");

    if (category.isNotEmpty())
    {
        if (!juce::UnitTest::getAllCategories().contains(category))
        {
            std::cerr << "Unknown test category: " << category << std::endl;
            std::cerr << "Available: " << juce::UnitTest::getAllCategories().joinIntoString(", ") << std::endl;
            return 2;
        }

        runner.runTestsInCategory(category);
    }
    else
    {
        runner.runAllTests();
    }

    int totalFailures = 0;
    int totalPasses = 0;

    for (int i = 0; i < runner.getNumResults(); ++i)
    {
        if (const auto* result = runner.getResult(i))
        {
            totalFailures += result->failures;
            totalPasses += result->passes;
        }
    }

    std::cout << std::endl << "Passed: " << totalPasses << ", failed: " << totalFailures << std::endl;
    return totalFailures > 0 ? 1 : 0;
}

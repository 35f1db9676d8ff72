#include <chrono>
#include <exception>

#include "config.hh"
#include "Logger.hh"
#include "log_utils.h"
#include "ResultAggregator.hh"
#include "TaskCatalog.hh"
#include "TaskScheduler.hh"

int main(int argc, char **argv)
{
    int exitCode = 0;
    optional<HarnessConfig> parsed;

    try
    {
        parsed = parseArguments(argc, argv, exitCode);
    }
    catch (const exception &e)
    {
        SAFE_CERR("Configuration error: " << e.what());
        return 2;
    }

    if (!parsed)
        return exitCode;

    const HarnessConfig &config = *parsed;
    Logger &log = Logger::instance();

    try
    {
        if (!config.logFile.empty())
            log.start(config.logFile);

        // ======== Step 1: Resolve the catalog against the base directory ========
        vector<TaskDescriptor> tasks = resolveCatalog(config.baseDir, config.catalog);

        Logger::dualSafeLog("Mode: " + TaskScheduler::policyToString(config.scheduler.policy) +
                            ", output: " + outputModeToString(config.scheduler.executor.outputMode) +
                            ", interpreter: " + (config.scheduler.executor.interpreter.empty() ? string("(none)") : config.scheduler.executor.interpreter));

        // ======== Step 2: Run every task ========
        auto start = chrono::steady_clock::now();

        TaskScheduler scheduler(config.scheduler);
        vector<TaskOutcome> outcomes = scheduler.run(tasks);

        long long totalMs = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();

        // ======== Step 3: Summarize ========
        ResultAggregator aggregator(std::move(outcomes), totalMs);
        aggregator.printSummary();

        if (!config.summaryJSON.empty())
        {
            aggregator.writeSummaryJSON(config.summaryJSON);
            Logger::dualSafeLog("Summary exported to " + config.summaryJSON);
        }

        exitCode = aggregator.exitCode();
    }
    catch (const exception &e)
    {
        Logger::dualSafeLog(string("Harness error: ") + e.what());
        exitCode = 2;
    }

    log.stop();
    return exitCode;
}

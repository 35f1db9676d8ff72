#include "ResultAggregator.hh"
#include "Logger.hh"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

ResultAggregator::ResultAggregator(vector<TaskOutcome> outcomes, long long totalDurationMs)
    : results(std::move(outcomes)), runSummary(summarize(results, totalDurationMs)) {}

RunSummary ResultAggregator::summarize(const vector<TaskOutcome> &outcomes, long long totalDurationMs)
{
    RunSummary summary;
    summary.total = static_cast<int>(outcomes.size());
    summary.totalDurationMs = totalDurationMs;

    for (const auto &outcome : outcomes)
    {
        if (outcome.success)
        {
            summary.succeeded++;
        }
        else
        {
            summary.failed++;
            summary.failures.push_back(outcome);
        }
    }

    return summary;
}

const RunSummary &ResultAggregator::summary() const
{
    return runSummary;
}

const vector<TaskOutcome> &ResultAggregator::outcomes() const
{
    return results;
}

int ResultAggregator::exitCode() const
{
    return runSummary.failed > 0 ? 1 : 0;
}

vector<string> ResultAggregator::renderLines() const
{
    vector<string> lines;
    const string rule(60, '=');
    const string thinRule(60, '-');

    lines.push_back(rule);
    lines.push_back("Execution Summary (Total time: " + formatDuration(runSummary.totalDurationMs) + ")");
    lines.push_back(rule);

    for (const auto &outcome : results)
    {
        ostringstream ss;
        ss << (outcome.success ? "✓ " : "✗ ") << left << setw(15) << outcome.name
           << " - " << formatDuration(outcome.durationMs);

        if (!outcome.success)
            ss << " (ERROR)";

        lines.push_back(ss.str());
    }

    lines.push_back(thinRule);
    lines.push_back("Results: " + to_string(runSummary.succeeded) + " successful, " + to_string(runSummary.failed) + " failed");

    if (runSummary.failures.empty())
        return lines;

    lines.push_back("");
    lines.push_back("Failed Tasks Details:");
    lines.push_back(thinRule);

    for (const auto &failure : runSummary.failures)
    {
        lines.push_back("");
        lines.push_back(failure.name + ":");
        lines.push_back("Error: " + (failure.error ? failure.error->message : string("unknown error")));

        if (!failure.output.empty())
        {
            string output = failure.output;
            if (output.back() == '\n')
                output.pop_back();

            lines.push_back("Output:\n" + output);
        }
    }

    return lines;
}

void ResultAggregator::printSummary() const
{
    for (const auto &line : renderLines())
        Logger::dualSafeLog(line);
}

/*
Same content as the console summary, for tools that want to post-process a run
*/
json ResultAggregator::exportSummaryJSON() const
{
    json j;
    j["total_tasks"] = runSummary.total;
    j["successful"] = runSummary.succeeded;
    j["failed"] = runSummary.failed;
    j["total_execution_time_ms"] = runSummary.totalDurationMs;
    j["exit_code"] = exitCode();

    json tasks = json::array();
    for (const auto &outcome : results)
        tasks.push_back(outcome.toJSON());

    j["tasks"] = tasks;
    return j;
}

void ResultAggregator::writeSummaryJSON(const string &path) const
{
    ofstream out(path, ios::out | ios::trunc);
    if (!out.is_open())
        throw runtime_error("Cannot open summary file: " + path);

    // Captured output is whatever the script printed; invalid UTF-8 is replaced rather than rejected
    out << exportSummaryJSON().dump(4, ' ', false, json::error_handler_t::replace) << '\n';
    out.flush();

    if (!out)
        throw runtime_error("Failed to write summary file: " + path);
}

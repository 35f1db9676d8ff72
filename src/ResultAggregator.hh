#pragma once

#include "TaskOutcome.hh"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using json = nlohmann::json;

// Derived once after the run, rendered and thrown away
struct RunSummary
{
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    long long totalDurationMs = 0;
    // Same order as the outcomes were handed in
    vector<TaskOutcome> failures;
};

class ResultAggregator
{
public:
    ResultAggregator(vector<TaskOutcome> outcomes, long long totalDurationMs);

    const RunSummary &summary() const;
    const vector<TaskOutcome> &outcomes() const;

    // 0 when every outcome succeeded (also for an empty run), 1 otherwise
    int exitCode() const;

    // Summary table, totals line and failure details, one string per console line
    vector<string> renderLines() const;

    // Prints renderLines() through the Logger
    void printSummary() const;

    json exportSummaryJSON() const;
    void writeSummaryJSON(const string &path) const;

    static RunSummary summarize(const vector<TaskOutcome> &outcomes, long long totalDurationMs);

private:
    vector<TaskOutcome> results;
    RunSummary runSummary;
};

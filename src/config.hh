#pragma once

#include "TaskScheduler.hh"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = filesystem;

// Everything one harness run is configured with
struct HarnessConfig
{
    fs::path baseDir = ".";
    vector<string> catalog;
    SchedulerOptions scheduler;

    string catalogFile;  // empty: --task entries or the built-in catalog
    string logFile;      // empty: console only
    string summaryJSON;  // empty: no JSON summary file
};

/*
Parse the command line. Returns nullopt when the program should exit right away
(help requested or invalid usage); exitCode then holds the status to exit with.
Catalog files are read here, so their errors propagate as exceptions.
*/
optional<HarnessConfig> parseArguments(int argc, const char *const *argv, int &exitCode);

/*
Read a catalog from JSON. Accepts either a bare array of entries or
{ "interpreter": "python3", "tasks": [ ... ] }. The interpreter, when present, is stored in *interpreter.
*/
vector<string> loadCatalogFile(const fs::path &path, optional<string> *interpreter = nullptr);

OutputMode parseOutputMode(const string &text);
SchedulePolicy parsePolicy(const string &text);
string outputModeToString(OutputMode mode);

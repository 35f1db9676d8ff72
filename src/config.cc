#include "config.hh"
#include "TaskCatalog.hh"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

OutputMode parseOutputMode(const string &text)
{
    if (text == "streamed")
        return OutputMode::Streamed;

    if (text == "buffered")
        return OutputMode::Buffered;

    throw invalid_argument("unknown output mode: " + text);
}

SchedulePolicy parsePolicy(const string &text)
{
    if (text == "sequential")
        return SchedulePolicy::Sequential;

    if (text == "parallel")
        return SchedulePolicy::Parallel;

    throw invalid_argument("unknown mode: " + text);
}

string outputModeToString(OutputMode mode)
{
    return mode == OutputMode::Streamed ? "streamed" : "buffered";
}

vector<string> loadCatalogFile(const fs::path &path, optional<string> *interpreter)
{
    ifstream in(path);
    if (!in.is_open())
        throw runtime_error("Cannot open catalog file: " + path.string());

    json j = json::parse(in);

    const json *tasks = &j;
    if (j.is_object())
    {
        if (!j.contains("tasks"))
            throw runtime_error("catalog file " + path.string() + " has no \"tasks\" array");

        tasks = &j["tasks"];

        if (interpreter && j.contains("interpreter"))
            *interpreter = j["interpreter"].get<string>();
    }

    if (!tasks->is_array())
        throw runtime_error("catalog file " + path.string() + ": tasks must be an array of file names");

    // get<string>() throws json::type_error for non-string entries
    vector<string> entries;
    for (const auto &entry : *tasks)
        entries.push_back(entry.get<string>());

    return entries;
}

optional<HarnessConfig> parseArguments(int argc, const char *const *argv, int &exitCode)
{
    HarnessConfig config;
    CLI::App app{"Runs a catalog of task scripts as child processes and reports the outcome of each"};

    string baseDir = ".";
    string mode = "parallel";
    string output;
    string interpreter;
    vector<string> tasks;
    int timeoutMs = 0;
    int maxParallel = 0;
    double progressSeconds = 10.0;
    bool color = false;

    app.add_option("base_dir", baseDir, "Directory holding the task files")->capture_default_str();
    app.add_option("-m,--mode", mode, "Scheduling policy")
        ->check(CLI::IsMember({"sequential", "parallel"}))
        ->capture_default_str();
    app.add_option("-o,--output", output, "Task output handling (default: buffered for parallel, streamed for sequential)")
        ->check(CLI::IsMember({"streamed", "buffered"}));
    app.add_option("-c,--catalog", config.catalogFile, "JSON catalog file")->check(CLI::ExistingFile);
    app.add_option("-t,--task", tasks, "Task file to run (repeatable, replaces the catalog)");
    app.add_option("-i,--interpreter", interpreter, "Program each task file is passed to (empty: run the file itself)");
    app.add_option("--timeout", timeoutMs, "Per-task timeout in milliseconds (0 = none)")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
    app.add_option("-j,--max-parallel", maxParallel, "Maximum concurrent tasks in parallel mode (0 = unbounded)")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
    app.add_option("--progress-interval", progressSeconds, "Seconds between progress updates in parallel mode")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--log-file", config.logFile, "Also write the log to this file");
    app.add_option("--summary-json", config.summaryJSON, "Write the run summary as JSON to this file");
    app.add_flag("--color", color, "Colorize progress lines");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        // app.exit() prints help or the error; any usage error becomes the harness fault status
        exitCode = app.exit(e) == 0 ? 0 : 2;
        return nullopt;
    }

    config.baseDir = baseDir;

    SchedulerOptions &sched = config.scheduler;
    sched.policy = parsePolicy(mode);
    sched.maxParallel = maxParallel;
    sched.progressInterval = chrono::milliseconds(static_cast<long long>(progressSeconds * 1000));
    sched.enableColor = color;

    if (!output.empty())
        sched.executor.outputMode = parseOutputMode(output);
    else
        sched.executor.outputMode = sched.policy == SchedulePolicy::Parallel ? OutputMode::Buffered : OutputMode::Streamed;

    sched.executor.timeoutMs = timeoutMs;

    optional<string> catalogInterpreter;

    if (!tasks.empty())
        config.catalog = tasks;
    else if (!config.catalogFile.empty())
        config.catalog = loadCatalogFile(config.catalogFile, &catalogInterpreter);
    else
        config.catalog = defaultCatalog();

    // --interpreter wins over the catalog file, which wins over the default
    if (app.count("--interpreter") > 0)
        sched.executor.interpreter = interpreter;
    else if (catalogInterpreter)
        sched.executor.interpreter = *catalogInterpreter;

    exitCode = 0;
    return config;
}

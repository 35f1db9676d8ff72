#pragma once

#include <filesystem>
#include <string>
#include <vector>

using namespace std;

namespace fs = filesystem;

// Identity of one schedulable unit, immutable once resolved
struct TaskDescriptor
{
    string name;  // catalog entry without its extension
    string entry; // catalog entry as written
    fs::path path;
};

// The collector scripts the harness runs when no catalog is supplied
const vector<string> &defaultCatalog();

/*
Keep the entries whose file exists under baseDir, in catalog order.
Missing entries are logged as warnings and dropped; they never fail the run.
*/
vector<TaskDescriptor> resolveCatalog(const fs::path &baseDir, const vector<string> &entries);

// "binance.py" -> "binance"
string displayNameOf(const string &entry);

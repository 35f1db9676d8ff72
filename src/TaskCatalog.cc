#include "TaskCatalog.hh"
#include "Logger.hh"

#include <system_error>

const vector<string> &defaultCatalog()
{
    static const vector<string> catalog = {
        "biconomy.py",
        "bigone.py",
        "binance.py",
        "bitget.py",
        "bitmart.py",
        "bitrue.py",
        "btse.py",
        "bybit.py",
        "coinbase.py",
        "coinex.py",
        "coinw.py",
        "cryptocom.py",
        "deepcoin.py",
        "digifinex.py",
        "gateio.py",
        "gemini.py",
        "hashkeyglobal.py",
        "htx.py",
        "kraken.py",
        "kucoin.py",
        "lbank.py",
        "mexc.py",
        "okx.py",
        "pionex.py",
        "toobit.py",
        "whitebit.py",
    };

    return catalog;
}

string displayNameOf(const string &entry)
{
    return fs::path(entry).stem().string();
}

vector<TaskDescriptor> resolveCatalog(const fs::path &baseDir, const vector<string> &entries)
{
    vector<TaskDescriptor> resolved;
    resolved.reserve(entries.size());

    for (const auto &entry : entries)
    {
        fs::path path = baseDir / entry;

        // Only a path that does not exist is skipped. Other stat errors (permissions, symlink loops)
        // keep the entry, and the launch reports them as a task failure.
        error_code ec;
        fs::status(path, ec);
        if (ec == errc::no_such_file_or_directory)
        {
            Logger::dualSafeLog("⚠ Skipping " + entry + " (file not found)");
            Logger::log(LogLevel::Warn, displayNameOf(entry), "missing", 0, ec.value());
            continue;
        }

        resolved.push_back(TaskDescriptor{displayNameOf(entry), entry, path});
    }

    return resolved;
}

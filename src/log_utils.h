#pragma once
#include <mutex>
#include <iostream>

using namespace std;

// Serializes every write the harness makes to the console.
// Child processes in streamed mode write to the same descriptors without it.
inline mutex g_logMutex;

#define SAFE_COUT(x)                        \
    {                                       \
        lock_guard<mutex> lock(g_logMutex); \
        cout << x << endl;                  \
    }

#define SAFE_CERR(msg)                      \
    {                                       \
        lock_guard<mutex> lock(g_logMutex); \
        cerr << msg << endl;                \
    }

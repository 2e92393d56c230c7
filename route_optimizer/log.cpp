#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
using namespace std;

static atomic<int> current_level{(int)LogLevel::Info};
static mutex write_mutex;

static void write_line(LogLevel level, const char* tag, const string& msg)
{
    if ((int)level > current_level.load()) return;
    lock_guard<mutex> lock(write_mutex);
    cerr << "[" << tag << "] " << msg << "\n";
}

void set_log_level(LogLevel level) { current_level.store((int)level); }

bool parse_log_level(const string& name_in, LogLevel& out)
{
    string name = name_in;
    transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return (char)tolower(c); });

    if (name == "error") out = LogLevel::Error;
    else if (name == "warn" || name == "warning") out = LogLevel::Warn;
    else if (name == "info") out = LogLevel::Info;
    else if (name == "debug") out = LogLevel::Debug;
    else return false;
    return true;
}

void log_error(const string& msg) { write_line(LogLevel::Error, "error", msg); }
void log_warn(const string& msg) { write_line(LogLevel::Warn, "warn", msg); }
void log_info(const string& msg) { write_line(LogLevel::Info, "info", msg); }
void log_debug(const string& msg) { write_line(LogLevel::Debug, "debug", msg); }

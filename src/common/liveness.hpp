#pragma once

#include <string>

enum class Liveness {
    Alive,
    NoRecord,  // pid file missing
    BadRecord, // pid file unreadable or not a positive integer
    Dead,      // no process with that pid
};

struct LivenessRecord {
    Liveness state = Liveness::NoRecord;
    int pid = 0;
};

// Reads the pid file fresh on every call and checks the process with signal 0.
// Advisory only: the process may exit right after a positive answer.
LivenessRecord check_liveness(const std::string& pid_path);

// Liveness of the worker owning `socket_path`, via its sibling pid file.
bool is_alive(const std::string& socket_path);

const char* to_string(Liveness state);

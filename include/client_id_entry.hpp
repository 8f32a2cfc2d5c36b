#pragma once

// Runs the client-id command line application; returns the process exit code.
// 0: success, 1: identifier failure, 2: bad usage or configuration.
int RunClientIdApplication(int argc, char *argv[]);

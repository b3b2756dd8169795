#pragma once

#include "platform.h"
#include "settings.h"

// Runs settings.command and returns the process exit status.
int run_command(const Settings& settings, HostsEnvironment& env);

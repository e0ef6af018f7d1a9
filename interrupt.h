#pragma once

#include <sys/types.h>

// SIGINT, SIGTERM, SIGHUP and SIGQUIT are recorded, not fatal. The first
// one received is kept and forwarded to the running child, if any.
void install_signal_handlers();

int pending_signal();
void clear_pending_signal();

// throws Interrupted if a signal has been received
void check_interrupted();

void set_foreground_child(pid_t pid);

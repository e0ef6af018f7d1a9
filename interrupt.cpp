#include <signal.h>
#include <string.h>

#include <atomic>
#include <stdexcept>

#include "error.h"
#include "interrupt.h"

static volatile sig_atomic_t received_signal = 0;
static std::atomic<pid_t> foreground_child{0};

static_assert(std::atomic<pid_t>::is_always_lock_free);

static void on_signal(int sig)
{
    if (received_signal == 0) received_signal = sig;
    auto pid = foreground_child.load();
    if (pid > 0) kill(pid, sig);
}

void install_signal_handlers()
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: blocking calls see EINTR
    for (auto sig:{SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
        if (sigaction(sig, &sa, nullptr) < 0) throw std::runtime_error("sigaction() failed");
    }
}

int pending_signal()
{
    return received_signal;
}

void clear_pending_signal()
{
    received_signal = 0;
}

void check_interrupted()
{
    if (received_signal != 0) throw Interrupted(received_signal);
}

void set_foreground_child(pid_t pid)
{
    foreground_child = pid;
}

// -----------------------------------------------------------------------------
// Ferryman — Signals, systemd notification and process hardening
// -----------------------------------------------------------------------------
#include "ferryman.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <thread>

#include <sys/prctl.h>
#include <sys/resource.h>

#ifdef __linux__
#include <sys/capability.h>
#include <systemd/sd-daemon.h>
#endif

namespace ferryman {

// -----------------------------------------------------------------------------
// Ferryman — Interrupt flag
// -----------------------------------------------------------------------------
static std::atomic<int> g_interrupt_signal{0};

int interrupt_signal() noexcept {
    return g_interrupt_signal.load(std::memory_order_acquire);
}

void request_interrupt(int sig) noexcept {
    int expected = 0;
    g_interrupt_signal.compare_exchange_strong(expected, sig, std::memory_order_acq_rel);
}

void clear_interrupt() noexcept {
    g_interrupt_signal.store(0, std::memory_order_release);
}

static void ferryman_signal_handler(int sig, siginfo_t* info, void* context) noexcept {
    (void)info;
    (void)context;
    request_interrupt(sig);
}

bool interruptible_sleep(std::chrono::milliseconds duration) noexcept {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    for (;;) {
        if (interrupt_signal() != 0) return false;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, constants::POLL_INTERVAL));
    }
}

// No SA_RESTART: a blocked waitpid() must return EINTR so the run can unwind.
SignalScope::SignalScope() noexcept {
    struct ::sigaction sa{};
    sa.sa_sigaction = ferryman_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_SIGINFO;

    if (::sigaction(SIGINT, &sa, &saved_int_) != 0 || ::sigaction(SIGTERM, &sa, &saved_term_) != 0) {
        FERRYMAN_LOG_WARN("signal", "Installing signal handlers failed: %s", strerror(errno));
    }

    struct ::sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (::sigaction(SIGPIPE, &ignore, &saved_pipe_) != 0) {
        FERRYMAN_LOG_WARN("signal", "Ignoring SIGPIPE failed: %s", strerror(errno));
    }
}

SignalScope::~SignalScope() {
    ::sigaction(SIGINT, &saved_int_, nullptr);
    ::sigaction(SIGTERM, &saved_term_, nullptr);
    ::sigaction(SIGPIPE, &saved_pipe_, nullptr);
}

// -----------------------------------------------------------------------------
// Ferryman — Integration with systemd for status notifications
// -----------------------------------------------------------------------------
SystemdNotifier& SystemdNotifier::instance() {
    static SystemdNotifier notifier;
    return notifier;
}

void SystemdNotifier::notify_ready() noexcept {
    if (ready_) return;
    ready_ = true;
#ifdef __linux__
    char buf[256];
    snprintf(buf, sizeof(buf),
             "READY=1\n"
             "STATUS=Ferryman replication running\n"
             "MAINPID=%lu",
             (unsigned long)getpid());
    sd_notify(0, buf);
#endif
}

void SystemdNotifier::notify_stopping() noexcept {
#ifdef __linux__
    sd_notify(0, "STOPPING=1\nSTATUS=Shutting down");
#endif
}

void SystemdNotifier::update_status(const char* fmt, ...) noexcept {
    char status[200];
    va_list args;
    va_start(args, fmt);
    vsnprintf(status, sizeof(status), fmt, args);
    va_end(args);

#ifdef __linux__
    char buf[256];
    snprintf(buf, sizeof(buf), "STATUS=%s", status);
    sd_notify(0, buf);
#else
    (void)status;
#endif
}

// -----------------------------------------------------------------------------
// Ferryman — Security: capability dropping and resource limits
// -----------------------------------------------------------------------------

// rsync needs file access and the reaper needs CAP_KILL, so only the
// capabilities unrelated to copying are cleared.
bool drop_capabilities() noexcept {
#ifdef __linux__
    cap_t caps = cap_get_proc();
    if (!caps) return false;

    cap_value_t cap_list[] = {
        CAP_SYS_ADMIN,
        CAP_SYS_RAWIO,
        CAP_NET_ADMIN,
        CAP_SYS_PTRACE,
        CAP_SYS_MODULE
    };

    cap_set_flag(caps, CAP_EFFECTIVE, sizeof(cap_list)/sizeof(cap_list[0]), cap_list, CAP_CLEAR);
    cap_set_flag(caps, CAP_PERMITTED, sizeof(cap_list)/sizeof(cap_list[0]), cap_list, CAP_CLEAR);
    cap_set_flag(caps, CAP_INHERITABLE, sizeof(cap_list)/sizeof(cap_list[0]), cap_list, CAP_CLEAR);

    if (cap_set_proc(caps) != 0) {
        FERRYMAN_LOG_WARN("security", "cap_set_proc failed: %s", strerror(errno));
        cap_free(caps);
        return false;
    }

    cap_free(caps);

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        FERRYMAN_LOG_WARN("security", "PR_SET_NO_NEW_PRIVS failed: %s", strerror(errno));
        return false;
    }

    FERRYMAN_LOG_INFO("security", "Dropped capabilities not needed for replication");
    return true;
#else
    return true;
#endif
}

void set_resource_limits() noexcept {
    struct rlimit core_limit = {0, 0};
    if (setrlimit(RLIMIT_CORE, &core_limit) != 0) {
        FERRYMAN_LOG_WARN("security", "Disabling core dumps failed: %s", strerror(errno));
    }

#ifdef __linux__
    if (prctl(PR_SET_DUMPABLE, 0) != 0) {
        FERRYMAN_LOG_WARN("security", "PR_SET_DUMPABLE failed: %s", strerror(errno));
    }
#endif
}

} // namespace ferryman

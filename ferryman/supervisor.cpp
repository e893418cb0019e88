// -----------------------------------------------------------------------------
// Ferryman — Run supervision: once-only cleanup and the run lifecycle
// -----------------------------------------------------------------------------
#include "ferryman.hpp"

#include <atomic>
#include <cstdlib>
#include <exception>

namespace ferryman {

// The guard whose sweep must still run if the process exits underneath it.
static std::atomic<RunGuard*> g_active_guard{nullptr};
static std::atomic<bool> g_atexit_registered{false};

static void release_active_guard_at_exit() {
    RunGuard* guard = g_active_guard.load(std::memory_order_acquire);
    if (guard) guard->release();
}

RunGuard::RunGuard(Sweeper& sweeper, const ReplicationJob& job) noexcept
    : sweeper_(sweeper), job_(job) {
    g_active_guard.store(this, std::memory_order_release);

    if (!g_atexit_registered.exchange(true, std::memory_order_acq_rel)) {
        if (atexit(release_active_guard_at_exit) != 0) {
            FERRYMAN_LOG_WARN("supervisor", "atexit registration failed, cleanup relies on scope exit");
        }
    }
}

RunGuard::~RunGuard() {
    release();
}

bool RunGuard::release() noexcept {
    if (released_) return false;
    released_ = true;

    RunGuard* self = this;
    g_active_guard.compare_exchange_strong(self, nullptr, std::memory_order_acq_rel);

    FERRYMAN_LOG_INFO("supervisor", "Running final cleanup");
    try {
        SweepReport report = sweeper_.sweep(job_);
        if (!report.remote_reachable) {
            FERRYMAN_LOG_WARN("supervisor", "Final cleanup could not reach %s", job_.dest_host.c_str());
        }
    } catch (const std::exception& e) {
        FERRYMAN_LOG_ERROR("supervisor", "Final cleanup failed: %s", e.what());
    }
    return true;
}

// -----------------------------------------------------------------------------
// Ferryman — Run lifecycle
// -----------------------------------------------------------------------------
RunSupervisor::RunSupervisor(const ReplicationJob& job, const RunOptions& opts, Sweeper& sweeper,
                             TransportInvoker& transport, CommandRunner& remote) noexcept
    : job_(job), opts_(opts), sweeper_(sweeper), transport_(transport), remote_(remote) {
    state_.mode = opts.initial_mode;
}

bool RunSupervisor::prepare_destination() {
    FERRYMAN_LOG_INFO("supervisor", "Ensuring destination directory %s exists", job_.remote_target().c_str());

    int rc = remote_.run({"mkdir", "-p", job_.dest_dir});
    if (rc != 0) {
        FERRYMAN_LOG_ERROR("supervisor", "Failed to create destination directory %s (status %d)",
                           job_.remote_target().c_str(), rc);
        return false;
    }
    return true;
}

int RunSupervisor::run() {
    SignalScope signals;
    RunGuard guard(sweeper_, job_);

    FERRYMAN_LOG_INFO("supervisor", "Pre-flight cleanup of leftover %s processes", job_.process_match.c_str());
    SweepReport preflight = sweeper_.sweep(job_);
    if (preflight.terminated > 0) {
        FERRYMAN_LOG_INFO("supervisor", "Pre-flight cleanup terminated %d process(es)", preflight.terminated);
    }

    if (interrupt_signal() != 0) {
        FERRYMAN_LOG_WARN("supervisor", "Received signal %d before the first attempt", interrupt_signal());
        return constants::EXIT_CODE_FATAL;
    }

    if (!prepare_destination()) return constants::EXIT_CODE_FATAL;

    ModeStateMachine machine(transport_, job_, opts_);
    RetryController retry(machine, job_);
    int rc = retry.run_until_success(state_);

    if (interrupt_signal() != 0) {
        FERRYMAN_LOG_WARN("supervisor", "Received signal %d, stopping", interrupt_signal());
        rc = constants::EXIT_CODE_FATAL;
    }

    guard.release();
    return rc;
}

} // namespace ferryman

// -----------------------------------------------------------------------------
// Ferryman — FAST/SAFE state machine and the unbounded retry loop
// -----------------------------------------------------------------------------
#include "ferryman.hpp"

#include <chrono>

namespace ferryman {

AttemptOutcome ModeStateMachine::attempt(Mode mode, Phase phase) {
    AttemptOutcome outcome = transport_.invoke(job_, opts_, mode, phase);

    // rsync may have exited on the same SIGINT and reported an ordinary error
    if (!outcome.interrupted && interrupt_signal() != 0) outcome.interrupted = true;
    return outcome;
}

// One-way: nothing ever moves the state back to FAST.
AttemptOutcome ModeStateMachine::fall_back(RunState& state, const AttemptOutcome& failed) {
    FERRYMAN_LOG_INFO("mode", "Switching to SAFE mode after FAST %s failure (exit %d)",
                      phase_name(failed.phase), failed.exit_status);
    state.mode = Mode::Safe;
    state.fell_back = true;
    return attempt(Mode::Safe, Phase::Copy);
}

AttemptOutcome ModeStateMachine::run_cycle(RunState& state) {
    AttemptOutcome copy = attempt(state.mode, Phase::Copy);
    if (copy.interrupted || copy.launch_failed) return copy;

    if (state.mode == Mode::Safe) {
        if (copy.ok()) FERRYMAN_LOG_INFO("mode", "SAFE mode completed successfully");
        return copy;
    }

    if (!copy.ok()) {
        FERRYMAN_LOG_WARN("mode", "FAST mode failed with exit code %d", copy.exit_status);
        return fall_back(state, copy);
    }

    FERRYMAN_LOG_INFO("mode", "FAST mode completed successfully");
    if (!opts_.checksum) return copy;

    AttemptOutcome verify = attempt(Mode::Fast, Phase::Verify);
    if (verify.interrupted || verify.launch_failed) return verify;

    if (!verify.ok()) {
        FERRYMAN_LOG_WARN("mode", "Checksum verification failed with exit code %d", verify.exit_status);
        return fall_back(state, verify);
    }

    FERRYMAN_LOG_INFO("mode", "Checksum verification passed");
    return verify;
}

// -----------------------------------------------------------------------------
// Ferryman — Retry loop
// -----------------------------------------------------------------------------
int RetryController::run_until_success(RunState& state) {
    for (;;) {
        log_banner("=============================");
        FERRYMAN_LOG_INFO("retry", "Rsync attempt #%u (mode: %s)", state.attempt, mode_name(state.mode));
        SystemdNotifier::instance().update_status("Attempt #%u (%s)", state.attempt, mode_name(state.mode));

        AttemptOutcome outcome = machine_.run_cycle(state);

        if (outcome.ok()) {
            state.terminal = true;
            FERRYMAN_LOG_INFO("retry", "Rsync completed successfully on attempt #%u (mode: %s)",
                              state.attempt, mode_name(state.mode));
            return constants::EXIT_CODE_OK;
        }

        if (outcome.interrupted) {
            FERRYMAN_LOG_WARN("retry", "Attempt #%u interrupted", state.attempt);
            return constants::EXIT_CODE_FATAL;
        }

        if (outcome.launch_failed) {
            FERRYMAN_LOG_ERROR("retry", "rsync could not be started, giving up");
            return constants::EXIT_CODE_FATAL;
        }

        if (state.mode == Mode::Fast) {
            FERRYMAN_LOG_ERROR("retry", "FAST mode failed with exit code %d and no fallback ran, giving up",
                               outcome.exit_status);
            return constants::EXIT_CODE_FATAL;
        }

        FERRYMAN_LOG_WARN("retry", "Safe mode failed with exit code %d. Retrying in %d seconds...",
                          outcome.exit_status, job_.retry_delay_sec);
        ++state.delays;

        if (!interruptible_sleep(std::chrono::seconds(job_.retry_delay_sec))) {
            FERRYMAN_LOG_WARN("retry", "Interrupted during retry delay");
            return constants::EXIT_CODE_FATAL;
        }

        ++state.attempt;
    }
}

} // namespace ferryman

// -----------------------------------------------------------------------------
// Ferryman — rsync invocation
// -----------------------------------------------------------------------------
#include "ferryman.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace ferryman {

bool exclude_file_usable(const ReplicationJob& job, const RunOptions& opts) noexcept {
    if (opts.no_excludes || job.exclude_file.empty()) return false;

    struct stat st;
    if (stat(job.exclude_file.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && st.st_size > 0;
}

std::vector<std::string> build_rsync_argv(const ReplicationJob& job, const RunOptions& opts,
                                          Mode mode, Phase phase) {
    std::vector<std::string> argv = {
        job.source_rsync_bin, "-rltDv", "--progress", "--sparse", "--partial",
    };

    if (opts.dry_run) argv.emplace_back("--dry-run");

    if (phase == Phase::Verify) {
        argv.push_back("--timeout=" + std::to_string(job.rsync_timeout_sec * constants::VERIFY_TIMEOUT_FACTOR));
        argv.emplace_back("--checksum");
    } else if (mode == Mode::Fast) {
        argv.push_back("--timeout=" + std::to_string(job.rsync_timeout_sec));
        argv.emplace_back("--whole-file");
        argv.emplace_back("--ignore-existing");
    } else {
        argv.push_back("--timeout=" + std::to_string(job.rsync_timeout_sec));
        argv.emplace_back("--append-verify");
        if (opts.checksum) {
            argv.emplace_back("--checksum");
            if (opts.checksum_type != "none") argv.push_back("--checksum-choice=" + opts.checksum_type);
        }
    }

    if (exclude_file_usable(job, opts)) argv.push_back("--exclude-from=" + job.exclude_file);

    argv.emplace_back("-e");
    argv.push_back(ssh_transport_command(job));
    argv.push_back("--rsync-path=" + job.dest_rsync_bin);
    argv.push_back(job.source_dir);
    argv.push_back(job.remote_target());
    return argv;
}

AttemptOutcome RsyncInvoker::invoke(const ReplicationJob& job, const RunOptions& opts,
                                    Mode mode, Phase phase) {
    AttemptOutcome outcome;
    outcome.mode = mode;
    outcome.phase = phase;

    if (phase == Phase::Verify) {
        FERRYMAN_LOG_INFO("rsync", "Running checksum verification pass%s", opts.dry_run ? " (dry-run)" : "");
    } else if (mode == Mode::Fast) {
        FERRYMAN_LOG_INFO("rsync", "Using FAST mode (whole-file, ignore-existing)%s",
                          opts.dry_run ? " (dry-run)" : "");
    } else {
        FERRYMAN_LOG_INFO("rsync", "Using SAFE mode (append-verify%s%s)%s",
                          opts.checksum ? ", checksum " : "",
                          opts.checksum ? opts.checksum_type.c_str() : "",
                          opts.dry_run ? " (dry-run)" : "");
    }

    FERRYMAN_LOG_INFO("rsync", "Source: %s", job.source_dir.c_str());
    FERRYMAN_LOG_INFO("rsync", "Destination: %s", job.remote_target().c_str());

    if (opts.no_excludes) {
        FERRYMAN_LOG_INFO("rsync", "Excludes disabled by --no-excludes");
    } else if (exclude_file_usable(job, opts)) {
        FERRYMAN_LOG_INFO("rsync", "Using exclude file: %s", job.exclude_file.c_str());
    } else {
        FERRYMAN_LOG_INFO("rsync", "No exclude file found or empty, skipping excludes");
    }

    const auto argv = build_rsync_argv(job, opts, mode, phase);

    const auto start = std::chrono::steady_clock::now();
    const int status = runner_.run(argv);
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    outcome.exit_status = status;

    if (status == constants::STATUS_INTERRUPTED) {
        outcome.interrupted = true;
        FERRYMAN_LOG_WARN("rsync", "rsync %s (%s) interrupted after %lld ms", phase_name(phase),
                          mode_name(mode), static_cast<long long>(outcome.elapsed.count()));
        return outcome;
    }

    if (status == constants::STATUS_LAUNCH_FAILED || status == constants::STATUS_FORK_FAILED) {
        outcome.launch_failed = true;
        FERRYMAN_LOG_ERROR("rsync", "Could not launch %s (status %d)", job.source_rsync_bin.c_str(), status);
        return outcome;
    }

    FERRYMAN_LOG_DEBUG("rsync", "rsync %s (%s) exited with %d after %lld ms", phase_name(phase),
                       mode_name(mode), status, static_cast<long long>(outcome.elapsed.count()));
    return outcome;
}

} // namespace ferryman

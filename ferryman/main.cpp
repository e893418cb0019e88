// -----------------------------------------------------------------------------
// Ferryman — Entry point
// -----------------------------------------------------------------------------
#include "ferryman.hpp"

#include <cstdio>
#include <ctime>
#include <string>

#include <sys/stat.h>
#include <syslog.h>

using namespace ferryman;

static void write_header(const ReplicationJob& job, const RunOptions& opts, const std::string& log_path) {
    char when[64];
    time_t now = time(nullptr);
    struct tm tm_time{};
    localtime_r(&now, &tm_time);
    strftime(when, sizeof(when), "%a %b %e %H:%M:%S %Z %Y", &tm_time);

    char line[1024];
    log_banner("=============================");
    snprintf(line, sizeof(line), "Starting rsync job at %s", when);
    log_banner(line);
    snprintf(line, sizeof(line), "Mode: %s, DryRun: %s, Checksum: %s",
             mode_name(opts.initial_mode), opts.dry_run ? "yes" : "no",
             opts.checksum ? opts.checksum_type.c_str() : "off");
    log_banner(line);
    snprintf(line, sizeof(line), "Source: %s", job.source_dir.c_str());
    log_banner(line);
    snprintf(line, sizeof(line), "Destination: %s", job.remote_target().c_str());
    log_banner(line);
    snprintf(line, sizeof(line), "Log file: %s", log_path.c_str());
    log_banner(line);
    log_banner("=============================");
}

static bool check_preconditions(const ReplicationJob& job) noexcept {
    if (access(job.source_rsync_bin.c_str(), X_OK) != 0) {
        FERRYMAN_LOG_ERROR("ferryman", "Source rsync binary not found or not executable: %s",
                           job.source_rsync_bin.c_str());
        return false;
    }

    struct stat st;
    if (stat(job.private_key.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        FERRYMAN_LOG_ERROR("ferryman", "Private key not found: %s", job.private_key.c_str());
        return false;
    }

    return true;
}

static int run_job(const ReplicationJob& job, const RunOptions& opts) {
    set_resource_limits();

    if (job.drop_capabilities && geteuid() == 0) {
        if (!drop_capabilities()) {
            FERRYMAN_LOG_WARN("ferryman", "Failed to drop capabilities, continuing with reduced security");
        }
    }

    PosixCommandRunner local_runner;
    SshCommandRunner remote_runner(local_runner, job);

    auto local_lister = probe_process_lister(local_runner, "Local");
    auto remote_lister = probe_process_lister(remote_runner, "Remote");
    LocalProcessControl local_control;
    RemoteProcessControl remote_control(remote_runner);

    ReaperHost local_host;
    local_host.label = "local";
    local_host.lister = local_lister.get();
    local_host.control = &local_control;
    local_host.protected_pids = {getpid(), getppid()};

    ReaperHost remote_host;
    remote_host.label = "remote";
    remote_host.lister = remote_lister.get();
    remote_host.control = &remote_control;

    ProcessReaper reaper(local_host, remote_host);
    RsyncInvoker invoker(local_runner);
    RunSupervisor supervisor(job, opts, reaper, invoker, remote_runner);

    SystemdNotifier::instance().notify_ready();
    int rc = supervisor.run();
    SystemdNotifier::instance().notify_stopping();

    FERRYMAN_LOG_INFO("ferryman", "Finished after %u attempt(s) in %s mode, exit code %d",
                      supervisor.state().attempt, mode_name(supervisor.state().mode), rc);
    return rc;
}

int main(int argc, char* argv[]) {
    auto job = load_job_from_env();
    if (!job) return constants::EXIT_CODE_FATAL;

    RunOptions opts;
    std::string error;
    switch (parse_run_options(argc, argv, job->default_mode, opts, error)) {
    case ParseStatus::Help:
        print_usage(argv[0], true);
        return constants::EXIT_CODE_FATAL;
    case ParseStatus::UsageError:
        fprintf(stderr, "%s\n", error.c_str());
        print_usage(argv[0], false);
        return constants::EXIT_CODE_FATAL;
    case ParseStatus::Ok:
        break;
    }

    if (!validate_run_options(opts, error)) {
        FERRYMAN_LOG_ERROR("ferryman", "%s", error.c_str());
        return constants::EXIT_CODE_FATAL;
    }

    if (job->use_syslog) {
        openlog("ferryman", LOG_PID | LOG_NDELAY, LOG_DAEMON);
        enable_syslog(true);
    }

    int rc = constants::EXIT_CODE_FATAL;
    std::string log_path;
    if (open_log_file(job->log_dir, log_path)) {
        write_header(*job, opts, log_path);
        if (check_preconditions(*job)) rc = run_job(*job, opts);
        close_log_file();
    } else {
        FERRYMAN_LOG_ERROR("ferryman", "Cannot open a run log in %s", job->log_dir.c_str());
    }

    if (job->use_syslog) {
        enable_syslog(false);
        closelog();
    }
    return rc;
}

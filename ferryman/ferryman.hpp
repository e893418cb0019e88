// -----------------------------------------------------------------------------
// Ferryman — Resilient host-to-host replication over rsync and ssh
// Supervises the copy tool, never speaks its protocol
// -----------------------------------------------------------------------------
#ifndef FERRYMAN_HPP
#define FERRYMAN_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace ferryman {

// -----------------------------------------------------------------------------
// Ferryman — System constants and configuration boundaries
// -----------------------------------------------------------------------------
namespace constants {
    constexpr int EXIT_CODE_OK = 0;
    constexpr int EXIT_CODE_FATAL = 1;
    constexpr int STATUS_FORK_FAILED = -1;
    constexpr int STATUS_INTERRUPTED = -2;
    constexpr int STATUS_LAUNCH_FAILED = 127;
    constexpr int STATUS_SSH_UNREACHABLE = 255;
    constexpr int DEFAULT_RSYNC_TIMEOUT_SEC = 5;
    constexpr int MAX_RSYNC_TIMEOUT_SEC = 3600;
    constexpr int VERIFY_TIMEOUT_FACTOR = 10;
    constexpr int DEFAULT_RETRY_DELAY_SEC = 10;
    constexpr int MAX_RETRY_DELAY_SEC = 86400;
    constexpr int DEFAULT_KILL_GRACE_MS = 1000;
    constexpr int MAX_KILL_GRACE_MS = 60000;
    constexpr size_t MAX_CAPTURE_BYTES = 1024 * 1024;
    constexpr std::chrono::milliseconds POLL_INTERVAL(100);
    constexpr const char* DEFAULT_CHECKSUM_TYPE = "xxh3";
    constexpr const char* DEFAULT_PROCESS_MATCH = "rsync";
}

// -----------------------------------------------------------------------------
// Ferryman — Logging
// -----------------------------------------------------------------------------
enum class LogLevel { Error, Warn, Info, Debug };

const char* log_level_name(LogLevel level) noexcept;

/// Receives every formatted line after the built-in sinks have written it.
using LogHandler = std::function<void(LogLevel, const char* module, const std::string& msg)>;

void set_log_handler(LogHandler handler);
void clear_log_handler() noexcept;

/// Route log lines to syslog(3). The caller owns openlog()/closelog().
void enable_syslog(bool on) noexcept;

/// Create `dir` if needed and open a fresh rsync_<timestamp>.log inside it.
bool open_log_file(const std::string& dir, std::string& path_out) noexcept;
void close_log_file() noexcept;

/// Write an undecorated line to stdout and the log file (banners, headers).
void log_banner(const char* line) noexcept;

__attribute__((format(printf, 3, 4)))
void log_output(const char* module, LogLevel level, const char* fmt, ...) noexcept;

#define FERRYMAN_LOG_INFO(module, ...)   ::ferryman::log_output(module, ::ferryman::LogLevel::Info,  __VA_ARGS__)
#define FERRYMAN_LOG_ERROR(module, ...)  ::ferryman::log_output(module, ::ferryman::LogLevel::Error, __VA_ARGS__)
#define FERRYMAN_LOG_WARN(module, ...)   ::ferryman::log_output(module, ::ferryman::LogLevel::Warn,  __VA_ARGS__)
#define FERRYMAN_LOG_DEBUG(module, ...)  ::ferryman::log_output(module, ::ferryman::LogLevel::Debug, __VA_ARGS__)

// -----------------------------------------------------------------------------
// Ferryman — RAII wrapper for file descriptors
// -----------------------------------------------------------------------------
class unique_fd {
    int fd_ = -1;
public:
    explicit unique_fd(int fd = -1) noexcept : fd_(fd) {}
    ~unique_fd() { if (fd_ >= 0) ::close(fd_); }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    unique_fd(unique_fd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    unique_fd& operator=(unique_fd&& o) noexcept {
        if (this != &o) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

    int get() const noexcept { return fd_; }
    int release() noexcept { int t = fd_; fd_ = -1; return t; }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

ssize_t safe_read(int fd, void* buf, size_t count) noexcept;
ssize_t safe_write(int fd, const void* buf, size_t count) noexcept;
int mkdir_p(const std::string& path, mode_t mode = 0755) noexcept;

// -----------------------------------------------------------------------------
// Ferryman — Transfer modes
// -----------------------------------------------------------------------------
enum class Mode { Fast, Safe };
enum class Phase { Copy, Verify };

const char* mode_name(Mode mode) noexcept;
const char* phase_name(Phase phase) noexcept;
bool parse_mode(const std::string& text, Mode& out) noexcept;

// -----------------------------------------------------------------------------
// Ferryman — Configuration
// -----------------------------------------------------------------------------

// Resolved once per run; read-only to every component.
struct ReplicationJob {
    std::string source_dir = "/vmfs/volumes/Host1SourceDatastore/";
    std::string dest_dir = "/vmfs/volumes/Host2DestDatastore/";
    std::string dest_host = "root@192.168.1.20";
    std::string private_key = "/vmfs/volumes/Host1SourceDatastore/privkey";
    std::string source_rsync_bin = "/vmfs/volumes/Host1SourceDatastore/rsync";
    std::string dest_rsync_bin = "/vmfs/volumes/Host2DestDatastore/rsync";
    std::string exclude_file = "/vmfs/volumes/Datastore1/rsync_excludes.txt";
    std::string log_dir = "/vmfs/volumes/Datastore1/rsync_logs";
    std::string process_match = constants::DEFAULT_PROCESS_MATCH;
    int rsync_timeout_sec = constants::DEFAULT_RSYNC_TIMEOUT_SEC;
    int retry_delay_sec = constants::DEFAULT_RETRY_DELAY_SEC;
    int kill_grace_ms = constants::DEFAULT_KILL_GRACE_MS;
    Mode default_mode = Mode::Safe;
    bool use_syslog = true;
    bool drop_capabilities = true;

    std::string remote_target() const { return dest_host + ":" + dest_dir; }
};

std::shared_ptr<const ReplicationJob> load_job_from_env() noexcept;

struct RunOptions {
    Mode initial_mode = Mode::Safe;
    bool dry_run = false;
    bool checksum = false;
    std::string checksum_type = constants::DEFAULT_CHECKSUM_TYPE;
    bool no_excludes = false;
};

enum class ParseStatus { Ok, Help, UsageError };

ParseStatus parse_run_options(int argc, const char* const argv[], Mode default_mode,
                              RunOptions& out, std::string& error);
bool checksum_type_supported(const std::string& type) noexcept;
bool validate_run_options(const RunOptions& opts, std::string& error);
void print_usage(const char* prog, bool detailed) noexcept;

// -----------------------------------------------------------------------------
// Ferryman — External command execution
// -----------------------------------------------------------------------------

// Returns the child's exit status, 128+signal when it was killed,
// STATUS_LAUNCH_FAILED when exec failed, STATUS_FORK_FAILED when no child
// was created and STATUS_INTERRUPTED when a signal cut the wait short.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual int run(const std::vector<std::string>& argv) = 0;
    virtual int capture(const std::vector<std::string>& argv, std::string& output) = 0;
};

class PosixCommandRunner : public CommandRunner {
public:
    int run(const std::vector<std::string>& argv) override;
    int capture(const std::vector<std::string>& argv, std::string& output) override;

private:
    int spawn_and_wait(const std::vector<std::string>& argv, std::string* output);
};

// Runs every command on the destination host through ssh.
class SshCommandRunner : public CommandRunner {
    CommandRunner& inner_;
    const ReplicationJob& job_;

    std::vector<std::string> wrap(const std::vector<std::string>& argv) const;

public:
    SshCommandRunner(CommandRunner& inner, const ReplicationJob& job) noexcept
        : inner_(inner), job_(job) {}

    int run(const std::vector<std::string>& argv) override;
    int capture(const std::vector<std::string>& argv, std::string& output) override;
};

std::string shell_quote(const std::string& arg);
std::vector<std::string> ssh_argv(const ReplicationJob& job);
std::string ssh_transport_command(const ReplicationJob& job);

// -----------------------------------------------------------------------------
// Ferryman — Process listing conventions
// -----------------------------------------------------------------------------
struct ProcessEntry {
    pid_t pid = 0;
    pid_t ppid = 0;       // 0 when the convention does not report it
    bool zombie = false;
    std::string command;
};

std::vector<ProcessEntry> parse_busybox_ps(const std::string& text, const std::string& match);
std::vector<ProcessEntry> parse_busybox_zombies(const std::string& text, const std::string& match);
std::vector<ProcessEntry> parse_linux_ps(const std::string& text, const std::string& match);

class ProcessLister {
public:
    virtual ~ProcessLister() = default;
    virtual const char* convention() const noexcept = 0;
    /// Live and zombie processes whose command contains `match`.
    virtual bool list(const std::string& match, std::vector<ProcessEntry>& out) = 0;
};

// ESXi / BusyBox: plain `ps`, zombies from `ps -z`.
class BusyBoxProcessLister : public ProcessLister {
    CommandRunner& runner_;
public:
    explicit BusyBoxProcessLister(CommandRunner& runner) noexcept : runner_(runner) {}
    const char* convention() const noexcept override { return "busybox"; }
    bool list(const std::string& match, std::vector<ProcessEntry>& out) override;
};

// procps: one `ps -eo pid=,ppid=,stat=,args=` snapshot.
class LinuxProcessLister : public ProcessLister {
    CommandRunner& runner_;
public:
    explicit LinuxProcessLister(CommandRunner& runner) noexcept : runner_(runner) {}
    const char* convention() const noexcept override { return "linux"; }
    bool list(const std::string& match, std::vector<ProcessEntry>& out) override;
};

std::unique_ptr<ProcessLister> probe_process_lister(CommandRunner& runner, const char* host_label);

class ProcessControl {
public:
    virtual ~ProcessControl() = default;
    virtual bool send(pid_t pid, int sig) = 0;
    virtual bool alive(pid_t pid) = 0;
};

class LocalProcessControl : public ProcessControl {
public:
    bool send(pid_t pid, int sig) override;
    bool alive(pid_t pid) override;
};

class RemoteProcessControl : public ProcessControl {
    CommandRunner& ssh_;
public:
    explicit RemoteProcessControl(CommandRunner& ssh) noexcept : ssh_(ssh) {}
    bool send(pid_t pid, int sig) override;
    bool alive(pid_t pid) override;
};

// -----------------------------------------------------------------------------
// Ferryman — Process reaper
// -----------------------------------------------------------------------------
struct ReaperHost {
    std::string label;
    ProcessLister* lister = nullptr;
    ProcessControl* control = nullptr;
    std::vector<pid_t> protected_pids;
    bool remote = false;
};

struct SweepReport {
    int terminated = 0;
    int forced = 0;
    int zombie_parents = 0;
    bool remote_reachable = true;
};

class Sweeper {
public:
    virtual ~Sweeper() = default;
    virtual SweepReport sweep(const ReplicationJob& job) = 0;
};

class ProcessReaper : public Sweeper {
    ReaperHost local_;
    ReaperHost remote_;

    bool sweep_host(ReaperHost& host, const ReplicationJob& job, SweepReport& report);
    void terminate_all(ReaperHost& host, const std::vector<pid_t>& pids,
                       const ReplicationJob& job, SweepReport& report);

public:
    ProcessReaper(ReaperHost local, ReaperHost remote);
    SweepReport sweep(const ReplicationJob& job) override;
};

// -----------------------------------------------------------------------------
// Ferryman — Transport invocation
// -----------------------------------------------------------------------------
struct AttemptOutcome {
    int exit_status = 0;
    std::chrono::milliseconds elapsed{0};
    Mode mode = Mode::Safe;
    Phase phase = Phase::Copy;
    bool launch_failed = false;
    bool interrupted = false;

    bool ok() const noexcept { return exit_status == 0 && !launch_failed && !interrupted; }
};

bool exclude_file_usable(const ReplicationJob& job, const RunOptions& opts) noexcept;
std::vector<std::string> build_rsync_argv(const ReplicationJob& job, const RunOptions& opts,
                                          Mode mode, Phase phase);

class TransportInvoker {
public:
    virtual ~TransportInvoker() = default;
    virtual AttemptOutcome invoke(const ReplicationJob& job, const RunOptions& opts,
                                  Mode mode, Phase phase) = 0;
};

class RsyncInvoker : public TransportInvoker {
    CommandRunner& runner_;
public:
    explicit RsyncInvoker(CommandRunner& runner) noexcept : runner_(runner) {}
    AttemptOutcome invoke(const ReplicationJob& job, const RunOptions& opts,
                          Mode mode, Phase phase) override;
};

// -----------------------------------------------------------------------------
// Ferryman — Mode state machine and retry loop
// -----------------------------------------------------------------------------

// Single owner: whoever drives the run. Never shared between runs.
struct RunState {
    Mode mode = Mode::Safe;
    unsigned attempt = 1;
    unsigned delays = 0;
    bool fell_back = false;
    bool terminal = false;
};

class ModeStateMachine {
    TransportInvoker& transport_;
    const ReplicationJob& job_;
    const RunOptions& opts_;

    AttemptOutcome attempt(Mode mode, Phase phase);
    AttemptOutcome fall_back(RunState& state, const AttemptOutcome& failed);

public:
    ModeStateMachine(TransportInvoker& transport, const ReplicationJob& job,
                     const RunOptions& opts) noexcept
        : transport_(transport), job_(job), opts_(opts) {}

    AttemptOutcome run_cycle(RunState& state);
};

class RetryController {
    ModeStateMachine& machine_;
    const ReplicationJob& job_;

public:
    RetryController(ModeStateMachine& machine, const ReplicationJob& job) noexcept
        : machine_(machine), job_(job) {}

    int run_until_success(RunState& state);
};

// -----------------------------------------------------------------------------
// Ferryman — Signals and system integration
// -----------------------------------------------------------------------------
int interrupt_signal() noexcept;
void request_interrupt(int sig) noexcept;
void clear_interrupt() noexcept;

/// Sleeps in POLL_INTERVAL slices; false when an interrupt arrived.
bool interruptible_sleep(std::chrono::milliseconds duration) noexcept;

// Installs SIGINT/SIGTERM handlers for its lifetime, restores the old ones after.
class SignalScope {
    struct ::sigaction saved_int_{};
    struct ::sigaction saved_term_{};
    struct ::sigaction saved_pipe_{};
public:
    SignalScope() noexcept;
    ~SignalScope();
    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;
};

class SystemdNotifier {
    bool ready_ = false;
public:
    static SystemdNotifier& instance();
    void notify_ready() noexcept;
    void notify_stopping() noexcept;
    __attribute__((format(printf, 2, 3)))
    void update_status(const char* fmt, ...) noexcept;
};

bool drop_capabilities() noexcept;
void set_resource_limits() noexcept;

// -----------------------------------------------------------------------------
// Ferryman — Run supervision
// -----------------------------------------------------------------------------

// The "run" resource: releasing it performs the final sweep, exactly once,
// whichever of scope exit, explicit release or process exit gets there first.
class RunGuard {
    Sweeper& sweeper_;
    const ReplicationJob& job_;
    bool released_ = false;

public:
    RunGuard(Sweeper& sweeper, const ReplicationJob& job) noexcept;
    ~RunGuard();
    RunGuard(const RunGuard&) = delete;
    RunGuard& operator=(const RunGuard&) = delete;

    bool release() noexcept;
    bool released() const noexcept { return released_; }
};

class RunSupervisor {
    const ReplicationJob& job_;
    const RunOptions& opts_;
    Sweeper& sweeper_;
    TransportInvoker& transport_;
    CommandRunner& remote_;
    RunState state_;

    bool prepare_destination();

public:
    RunSupervisor(const ReplicationJob& job, const RunOptions& opts, Sweeper& sweeper,
                  TransportInvoker& transport, CommandRunner& remote) noexcept;

    int run();
    const RunState& state() const noexcept { return state_; }
};

} // namespace ferryman

#endif // FERRYMAN_HPP

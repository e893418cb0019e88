// -----------------------------------------------------------------------------
// Ferryman — Process listing, signalling and the stray-process reaper
// -----------------------------------------------------------------------------
#include "ferryman.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/wait.h>

namespace ferryman {

static bool parse_pid(const std::string& text, pid_t& out) noexcept {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || v <= 0) return false;
    out = static_cast<pid_t>(v);
    return true;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// -----------------------------------------------------------------------------
// Ferryman — ps output parsers
// -----------------------------------------------------------------------------

// "  PID USER       VSZ STAT COMMAND" or ESXi "WID CID World Name":
// the first column is the pid, everything after it is searched.
std::vector<ProcessEntry> parse_busybox_ps(const std::string& text, const std::string& match) {
    std::vector<ProcessEntry> out;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string first;
        ProcessEntry e;
        if (!(fields >> first) || !parse_pid(first, e.pid)) continue;

        std::string rest;
        std::getline(fields, rest);
        e.command = trim(rest);
        if (e.command.find(match) == std::string::npos) continue;

        out.push_back(std::move(e));
    }
    return out;
}

// `ps -z`: zombie pid, then its parent.
std::vector<ProcessEntry> parse_busybox_zombies(const std::string& text, const std::string& match) {
    std::vector<ProcessEntry> out;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string pid_text;
        std::string ppid_text;
        ProcessEntry e;
        if (!(fields >> pid_text >> ppid_text)) continue;
        if (!parse_pid(pid_text, e.pid) || !parse_pid(ppid_text, e.ppid)) continue;

        std::string rest;
        std::getline(fields, rest);
        e.command = trim(rest);
        if (e.command.find(match) == std::string::npos) continue;

        e.zombie = true;
        out.push_back(std::move(e));
    }
    return out;
}

// `ps -eo pid=,ppid=,stat=,args=`
std::vector<ProcessEntry> parse_linux_ps(const std::string& text, const std::string& match) {
    std::vector<ProcessEntry> out;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string pid_text;
        std::string ppid_text;
        std::string stat;
        ProcessEntry e;
        if (!(fields >> pid_text >> ppid_text >> stat)) continue;
        if (!parse_pid(pid_text, e.pid)) continue;
        // init's children report ppid 0
        if (ppid_text != "0" && !parse_pid(ppid_text, e.ppid)) continue;

        std::string rest;
        std::getline(fields, rest);
        e.command = trim(rest);
        if (e.command.find(match) == std::string::npos) continue;

        e.zombie = !stat.empty() && stat[0] == 'Z';
        out.push_back(std::move(e));
    }
    return out;
}

// -----------------------------------------------------------------------------
// Ferryman — Listing conventions
// -----------------------------------------------------------------------------
bool BusyBoxProcessLister::list(const std::string& match, std::vector<ProcessEntry>& out) {
    std::string text;
    int rc = runner_.capture({"ps"}, text);
    if (rc != 0) {
        FERRYMAN_LOG_DEBUG("reaper", "ps failed with status %d", rc);
        return false;
    }

    out = parse_busybox_ps(text, match);

    std::string ztext;
    rc = runner_.capture({"ps", "-z"}, ztext);
    if (rc != 0) {
        FERRYMAN_LOG_DEBUG("reaper", "ps -z failed with status %d, skipping zombie scan", rc);
        return true;
    }

    auto zombies = parse_busybox_zombies(ztext, match);
    out.erase(std::remove_if(out.begin(), out.end(), [&](const ProcessEntry& live) {
                  return std::any_of(zombies.begin(), zombies.end(),
                                     [&](const ProcessEntry& z) { return z.pid == live.pid; });
              }),
              out.end());
    out.insert(out.end(), zombies.begin(), zombies.end());
    return true;
}

bool LinuxProcessLister::list(const std::string& match, std::vector<ProcessEntry>& out) {
    std::string text;
    int rc = runner_.capture({"ps", "-eo", "pid=,ppid=,stat=,args="}, text);
    if (rc != 0) {
        FERRYMAN_LOG_DEBUG("reaper", "ps -eo failed with status %d", rc);
        return false;
    }

    out = parse_linux_ps(text, match);
    return true;
}

std::unique_ptr<ProcessLister> probe_process_lister(CommandRunner& runner, const char* host_label) {
    std::string ignored;
    int rc = runner.capture({"ps", "-z"}, ignored);

    if (rc == 0) {
        FERRYMAN_LOG_INFO("reaper", "%s host uses ESXi/BusyBox process listing", host_label);
        return std::make_unique<BusyBoxProcessLister>(runner);
    }

    if (rc == constants::STATUS_SSH_UNREACHABLE) {
        FERRYMAN_LOG_WARN("reaper", "%s host unreachable while probing, assuming ESXi/BusyBox process listing",
                          host_label);
        return std::make_unique<BusyBoxProcessLister>(runner);
    }

    FERRYMAN_LOG_INFO("reaper", "%s host uses Linux process listing", host_label);
    return std::make_unique<LinuxProcessLister>(runner);
}

// -----------------------------------------------------------------------------
// Ferryman — Signal delivery
// -----------------------------------------------------------------------------
bool LocalProcessControl::send(pid_t pid, int sig) {
    if (kill(pid, sig) == 0) return true;
    if (errno != ESRCH) {
        FERRYMAN_LOG_WARN("reaper", "kill(%d, %d) failed: %s", pid, sig, strerror(errno));
    }
    return false;
}

bool LocalProcessControl::alive(pid_t pid) {
    // Our own children must be collected or they never leave the table
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) return false;

    if (kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

bool RemoteProcessControl::send(pid_t pid, int sig) {
    std::string ignored;
    int rc = ssh_.capture({"kill", "-" + std::to_string(sig), std::to_string(pid)}, ignored);
    if (rc == constants::STATUS_SSH_UNREACHABLE) {
        FERRYMAN_LOG_WARN("reaper", "Remote host unreachable while signalling PID %d", pid);
    }
    return rc == 0;
}

bool RemoteProcessControl::alive(pid_t pid) {
    std::string ignored;
    return ssh_.capture({"kill", "-0", std::to_string(pid)}, ignored) == 0;
}

// -----------------------------------------------------------------------------
// Ferryman — Reaper
// -----------------------------------------------------------------------------
ProcessReaper::ProcessReaper(ReaperHost local, ReaperHost remote)
    : local_(std::move(local)), remote_(std::move(remote)) {
    local_.remote = false;
    remote_.remote = true;
}

SweepReport ProcessReaper::sweep(const ReplicationJob& job) {
    SweepReport report;

    FERRYMAN_LOG_INFO("reaper", "Running %s cleanup... (local & remote)", job.process_match.c_str());

    if (!sweep_host(local_, job, report)) {
        FERRYMAN_LOG_WARN("reaper", "Local process listing failed, local cleanup skipped");
    }

    if (!sweep_host(remote_, job, report)) {
        report.remote_reachable = false;
        FERRYMAN_LOG_WARN("reaper", "Remote host %s unreachable, remote cleanup skipped",
                          job.dest_host.c_str());
    }

    FERRYMAN_LOG_DEBUG("reaper", "Sweep done: terminated=%d forced=%d zombie_parents=%d",
                       report.terminated, report.forced, report.zombie_parents);
    return report;
}

bool ProcessReaper::sweep_host(ReaperHost& host, const ReplicationJob& job, SweepReport& report) {
    if (!host.lister || !host.control) return true;

    std::vector<ProcessEntry> procs;
    if (!host.lister->list(job.process_match, procs)) return false;

    auto is_protected = [&host](pid_t pid) {
        return pid <= 1 ||
               std::find(host.protected_pids.begin(), host.protected_pids.end(), pid) != host.protected_pids.end();
    };

    std::vector<pid_t> targets;
    for (const auto& p : procs) {
        if (p.zombie || is_protected(p.pid)) continue;
        if (std::find(targets.begin(), targets.end(), p.pid) != targets.end()) continue;

        FERRYMAN_LOG_INFO("reaper", "Killing %s%s PID %d", host.remote ? "leftover (remote) " : "",
                          job.process_match.c_str(), p.pid);
        targets.push_back(p.pid);
    }

    // A zombie only goes away once its parent does
    for (const auto& z : procs) {
        if (!z.zombie || is_protected(z.ppid)) continue;
        if (std::find(targets.begin(), targets.end(), z.ppid) != targets.end()) continue;

        FERRYMAN_LOG_INFO("reaper", "Zombie %d detected on %s host, killing parent %d",
                          z.pid, host.label.c_str(), z.ppid);
        targets.push_back(z.ppid);
        ++report.zombie_parents;
    }

    if (!targets.empty()) terminate_all(host, targets, job, report);
    return true;
}

void ProcessReaper::terminate_all(ReaperHost& host, const std::vector<pid_t>& pids,
                                  const ReplicationJob& job, SweepReport& report) {
    std::vector<pid_t> pending;
    for (pid_t pid : pids) {
        if (host.control->send(pid, SIGTERM)) {
            pending.push_back(pid);
            ++report.terminated;
        }
    }

    // Cleanup must finish even while an interrupt is pending, so no interruptible sleep here
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(job.kill_grace_ms);
    while (!pending.empty()) {
        pending.erase(std::remove_if(pending.begin(), pending.end(),
                                     [&host](pid_t pid) { return !host.control->alive(pid); }),
                      pending.end());
        if (pending.empty() || std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(constants::POLL_INTERVAL);
    }

    for (pid_t pid : pending) {
        FERRYMAN_LOG_WARN("reaper", "PID %d on %s host survived SIGTERM, sending SIGKILL",
                          pid, host.label.c_str());
        if (host.control->send(pid, SIGKILL)) ++report.forced;
    }
}

} // namespace ferryman

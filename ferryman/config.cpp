// -----------------------------------------------------------------------------
// Ferryman — Environment-based configuration and command line options
// -----------------------------------------------------------------------------
#include "ferryman.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace ferryman {

static const char* const SUPPORTED_CHECKSUMS[] = {
    "md5", "md4", "sha1", "sha256", "sha512", "xxh64", "xxh128", "xxh3", "none"
};

const char* mode_name(Mode mode) noexcept {
    return mode == Mode::Fast ? "FAST" : "SAFE";
}

const char* phase_name(Phase phase) noexcept {
    return phase == Phase::Copy ? "copy" : "checksum";
}

bool parse_mode(const std::string& text, Mode& out) noexcept {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "FAST") {
        out = Mode::Fast;
        return true;
    }
    if (upper == "SAFE") {
        out = Mode::Safe;
        return true;
    }
    return false;
}

std::shared_ptr<const ReplicationJob> load_job_from_env() noexcept {
    auto job = std::make_shared<ReplicationJob>();

    if (const char* v = getenv("SOURCE_DIR")) job->source_dir = v;
    if (const char* v = getenv("DEST_DIR")) job->dest_dir = v;
    if (const char* v = getenv("DEST_HOST")) job->dest_host = v;
    if (const char* v = getenv("PRIVKEY")) job->private_key = v;
    if (const char* v = getenv("SOURCE_RSYNC_BIN")) job->source_rsync_bin = v;
    if (const char* v = getenv("DEST_RSYNC_BIN")) job->dest_rsync_bin = v;
    if (const char* v = getenv("EXCLUDE_FILE")) job->exclude_file = v;
    if (const char* v = getenv("LOG_DIR")) job->log_dir = v;
    if (const char* v = getenv("PROCESS_MATCH")) job->process_match = v;

    auto safe_stoi = [](const char* name, int default_val) -> int {
        const char* v = getenv(name);
        if (!v) return default_val;
        try {
            return std::stoi(v);
        } catch (const std::exception&) {
            FERRYMAN_LOG_WARN("config", "Ignoring non-numeric %s='%s', using %d", name, v, default_val);
            return default_val;
        }
    };

    auto parse_bool = [](const char* v, bool default_val) -> bool {
        if (!v) return default_val;
        return strcmp(v, "0") != 0 && strcmp(v, "false") != 0 && strcmp(v, "no") != 0;
    };

    job->rsync_timeout_sec = safe_stoi("RSYNC_TIMEOUT", job->rsync_timeout_sec);
    job->retry_delay_sec = safe_stoi("RETRY_DELAY", job->retry_delay_sec);
    job->kill_grace_ms = safe_stoi("KILL_GRACE_MS", job->kill_grace_ms);
    job->use_syslog = parse_bool(getenv("USE_SYSLOG"), job->use_syslog);
    job->drop_capabilities = parse_bool(getenv("DROP_CAPABILITIES"), job->drop_capabilities);

    if (const char* v = getenv("RSYNC_MODE")) {
        if (!parse_mode(v, job->default_mode)) {
            FERRYMAN_LOG_ERROR("config", "Configuration error: RSYNC_MODE must be FAST or SAFE, got '%s'", v);
            return nullptr;
        }
    }

    // Validation
    if (job->source_dir.empty() || job->dest_dir.empty() || job->dest_host.empty() ||
        job->private_key.empty() || job->source_rsync_bin.empty() ||
        job->dest_rsync_bin.empty() || job->log_dir.empty()) {
        FERRYMAN_LOG_ERROR("config", "Configuration error: paths and host cannot be empty");
        return nullptr;
    }

    if (job->source_dir[0] != '/' || job->dest_dir[0] != '/') {
        FERRYMAN_LOG_ERROR("config", "Configuration error: source and destination must be absolute");
        return nullptr;
    }

    if (job->process_match.empty()) {
        FERRYMAN_LOG_ERROR("config", "Configuration error: PROCESS_MATCH cannot be empty");
        return nullptr;
    }

    // Clamping
    job->rsync_timeout_sec = std::clamp(job->rsync_timeout_sec, 1, constants::MAX_RSYNC_TIMEOUT_SEC);
    job->retry_delay_sec = std::clamp(job->retry_delay_sec, 0, constants::MAX_RETRY_DELAY_SEC);
    job->kill_grace_ms = std::clamp(job->kill_grace_ms, 0, constants::MAX_KILL_GRACE_MS);

    return job;
}

// -----------------------------------------------------------------------------
// Ferryman — Command line
// -----------------------------------------------------------------------------
ParseStatus parse_run_options(int argc, const char* const argv[], Mode default_mode,
                              RunOptions& out, std::string& error) {
    RunOptions opts;
    opts.initial_mode = default_mode;

    static const char checksum_prefix[] = "--checksum-type=";
    const size_t prefix_len = sizeof(checksum_prefix) - 1;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--fast") {
            opts.initial_mode = Mode::Fast;
        } else if (arg == "--safe") {
            opts.initial_mode = Mode::Safe;
        } else if (arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "--checksum") {
            opts.checksum = true;
        } else if (arg.compare(0, prefix_len, checksum_prefix) == 0) {
            opts.checksum_type = arg.substr(prefix_len);
            opts.checksum = true;
        } else if (arg == "--no-excludes") {
            opts.no_excludes = true;
        } else if (arg == "-h" || arg == "--help") {
            return ParseStatus::Help;
        } else {
            error = "Unknown argument: " + arg;
            return ParseStatus::UsageError;
        }
    }

    out = opts;
    return ParseStatus::Ok;
}

bool checksum_type_supported(const std::string& type) noexcept {
    for (const char* known : SUPPORTED_CHECKSUMS) {
        if (type == known) return true;
    }
    return false;
}

bool validate_run_options(const RunOptions& opts, std::string& error) {
    if (opts.checksum && !checksum_type_supported(opts.checksum_type)) {
        error = "Invalid checksum type: " + opts.checksum_type;
        return false;
    }
    return true;
}

void print_usage(const char* prog, bool detailed) noexcept {
    if (!detailed) {
        printf("Usage: %s [--fast | --safe] [--dry-run] [--checksum | --checksum-type=<algo>] [--no-excludes]\n",
               prog);
        return;
    }

    printf("\nUsage: %s [--fast | --safe] [--dry-run] [--checksum --checksum-type=<algo>] [--no-excludes]\n\n", prog);
    printf("  --fast                  Run rsync in whole-file mode (no partial verification)\n");
    printf("  --safe                  Run rsync in append-verify mode (slower, safer)\n");
    printf("  --dry-run               Test run without copying files\n");
    printf("  --checksum              Enable checksum comparison (very slow)\n");
    printf("  --checksum-type=<algo>  One of:");
    for (const char* known : SUPPORTED_CHECKSUMS) printf(" %s", known);
    printf(" (default: %s)\n", constants::DEFAULT_CHECKSUM_TYPE);
    printf("  --no-excludes           Ignore the exclude file\n\n");
}

} // namespace ferryman

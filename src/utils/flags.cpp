#include "flags.hpp"

DEFINE_string(custom_tbb_parallel_control, "",
              "TBB arena concurrency control, e.g. offload:4,arena2:8");
DEFINE_int32(offload_threads, 0,
             "Max threads running blocking transfers (0 for the 'offload' "
             "entry of --custom_tbb_parallel_control, then TBB default)");

DEFINE_string(dest, "", "Destination directory (default: current directory)");
DEFINE_string(proxy, "", "Optional HTTP proxy, e.g. http://127.0.0.1:8881");
DEFINE_string(kind, "video", "Media kind to fetch: video or audio");

DEFINE_string(log_dir, "logs", "Directory for the rotating log file");
DEFINE_uint64(log_max_file_size, 10 * 1024 * 1024,
              "Max bytes of a single log file before rotation");
DEFINE_uint64(log_max_backup_files, 3, "Number of rotated log files to keep");
DEFINE_string(log_min_level, "info", "debug, info, warn, error or fatal");
DEFINE_bool(log_to_console, false, "Also echo log lines to stderr");

DEFINE_int32(connect_timeout_sec, 30, "HTTP connect timeout in seconds");
DEFINE_string(user_agent, "media-fetcher/1.0", "HTTP User-Agent header");

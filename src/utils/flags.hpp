#ifndef FETCHER_FLAGS_HPP_
#define FETCHER_FLAGS_HPP_

#include <gflags/gflags.h>

// 所有 flag 在 flags.cpp 中定义，库和可执行文件共享

// 线程池
DECLARE_string(custom_tbb_parallel_control);
DECLARE_int32(offload_threads);

// 任务参数
DECLARE_string(dest);
DECLARE_string(proxy);
DECLARE_string(kind);

// 日志
DECLARE_string(log_dir);
DECLARE_uint64(log_max_file_size);
DECLARE_uint64(log_max_backup_files);
DECLARE_string(log_min_level);
DECLARE_bool(log_to_console);

// HTTP
DECLARE_int32(connect_timeout_sec);
DECLARE_string(user_agent);

#endif  // FETCHER_FLAGS_HPP_

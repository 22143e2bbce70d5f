#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Host ceilings.
DECLARE_double(max_timeout_seconds);
DECLARE_int64(max_memory_bytes);
DECLARE_int64(max_output_bytes);
DECLARE_bool(clamp_budgets);

// Defaults used by the command line front end.
DECLARE_double(default_timeout_seconds);
DECLARE_int64(default_memory_bytes);
DECLARE_int64(default_output_bytes);

// Sandbox configuration.
DECLARE_string(temp_directory);
DECLARE_int32(memory_poll_interval_millis);
DECLARE_int32(kill_grace_millis);
DECLARE_bool(require_isolation);
DECLARE_bool(require_hard_memory_limit);
DECLARE_bool(allow_network);
DECLARE_string(cgroup_root);
DECLARE_string(readonly_paths);
DECLARE_string(sandbox_path);
DECLARE_int32(max_concurrent_executions);
DECLARE_int32(max_processes);
DECLARE_int32(max_open_files);
DECLARE_int64(max_file_size_bytes);

#endif

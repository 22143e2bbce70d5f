#include "util/flags.hpp"

DEFINE_double(max_timeout_seconds, 60,
              "Largest wall clock timeout a request may ask for");
DEFINE_int64(max_memory_bytes, 1LL << 30,
             "Largest memory ceiling a request may ask for");
DEFINE_int64(max_output_bytes, 1LL << 20,
             "Largest combined stdout+stderr size a request may ask for");
DEFINE_bool(clamp_budgets, false,
            "Clamp budgets above the host ceilings instead of rejecting them");

DEFINE_double(default_timeout_seconds, 30,
              "Timeout used when a request does not specify one");
DEFINE_int64(default_memory_bytes, 256LL << 20,
             "Memory ceiling used when a request does not specify one");
DEFINE_int64(default_output_bytes, 64LL << 10,
             "Output ceiling used when a request does not specify one");

DEFINE_string(temp_directory, "/tmp/codebox",
              "Where the working directories should be created");
DEFINE_int32(memory_poll_interval_millis, 100,
             "Interval between memory samples when the kernel cannot enforce "
             "a hard memory ceiling");
DEFINE_int32(kill_grace_millis, 200,
             "Time between SIGTERM and SIGKILL when terminating a process "
             "tree");
DEFINE_bool(require_isolation, true,
            "Refuse to run code when filesystem, network and process "
            "isolation are not available");
DEFINE_bool(require_hard_memory_limit, false,
            "Refuse to run code when memory can only be enforced by polling");
DEFINE_bool(allow_network, false,
            "Allow requests to ask for network access");
DEFINE_string(cgroup_root, "",
              "Delegated cgroup v2 directory under which per-execution "
              "cgroups are created. If unset, the cgroup of this process is "
              "used, which only works if its controllers are already enabled "
              "for its children (in general, set this unless running in the "
              "root cgroup)");
DEFINE_string(readonly_paths,
              "/bin,/sbin,/usr,/lib,/lib32,/lib64,/libx32,/etc/alternatives,"
              "/etc/ld.so.cache,/etc/ld.so.conf,/etc/ld.so.conf.d,"
              "/etc/localtime",
              "Comma separated host paths visible (read-only) inside the "
              "sandbox");
DEFINE_string(sandbox_path, "/usr/local/bin:/usr/bin:/bin",
              "PATH of the executed code, also used to find the interpreters");
DEFINE_int32(max_concurrent_executions, 0,
             "Number of executions that may run at the same time. If unset, "
             "autodetect");
DEFINE_int32(max_processes, 64,
             "Maximum number of processes in one execution");
DEFINE_int32(max_open_files, 256,
             "Maximum number of open files per process");
DEFINE_int64(max_file_size_bytes, 16LL << 20,
             "Maximum size of a file written by the executed code");

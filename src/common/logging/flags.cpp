#include <gflags/gflags.h>

DEFINE_string(log_level, "info", "Minimum log level (trace, debug, info, warn, error, critical, off)");
DEFINE_string(log_file, "sg_engine.log", "Log file path");
DEFINE_int32(log_max_size, 10485760, "Max log file size in bytes before rotation");
DEFINE_int32(log_max_files, 3, "Number of rotated log files to keep");

DEFINE_int32(worker_threads, 0, "Worker threads for fan-out steps (0 = hardware concurrency)");
DEFINE_int32(recursion_limit, 25, "Maximum graph steps per invocation");
DEFINE_string(checkpoint_dir, "", "Directory for file checkpoints (empty = in-memory)");

#pragma once
// tests/test_layer2_service/workers/logger_workers.h
//
// Logger scenarios, each run in its own process. Dispatched as "logger.<scenario>".
#include <string>

namespace hostkeeper::tests::worker::logger
{
int file_sink_basic(const std::string &log_path);
int level_filtering(const std::string &log_path);
int multithread_stress(const std::string &log_path, int threads, int per_thread);
int drops_before_init();
int write_error_callback(const std::string &bad_dir);
} // namespace hostkeeper::tests::worker::logger

#ifndef CLIPBRIDGE_COMMON_CONFIG_H_
#define CLIPBRIDGE_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>

namespace ClipBridge {

/// Readiness configs
/// Hard deadline for a server worker to report readiness
constexpr int64_t SERVER_STARTUP_TIMEOUT_MS = 60000;
/// Hard deadline for a client worker to report readiness
constexpr int64_t CLIENT_STARTUP_TIMEOUT_MS = 10000;
/// The delay after spawn before the single TCP readiness probe is attempted
constexpr int64_t READINESS_PROBE_DELAY_MS = 3000;
/// The timeout for the TCP readiness probe connect
constexpr int64_t READINESS_PROBE_TIMEOUT_MS = 2000;

/// Stop configs
/// Time given to the worker to exit after SIGTERM before SIGKILL is sent
constexpr int64_t STOP_GRACE_PERIOD_MS = 5000;
/// Poll interval for exit detection when pidfd is unavailable
constexpr int64_t EXIT_POLL_INTERVAL_MS = 100;
/// How long output pipes may stay open after the worker has been reaped
/// (a leftover grandchild can hold them) before they are closed forcibly
constexpr int64_t EXIT_DRAIN_TIMEOUT_MS = 500;

/// Worker defaults
constexpr int DEFAULT_WORKER_PORT = 8000;
constexpr char DEFAULT_LOG_LEVEL[] = "INFO";
constexpr char DEFAULT_PYTHON_PATH[] = "python3";
constexpr char DEFAULT_SERVER_SCRIPT[] = "utils/server.py";
constexpr char DEFAULT_CLIENT_SCRIPT[] = "utils/client.py";
constexpr char DEFAULT_SITE_PACKAGES[] = "utils/.venv/lib/python3.9/site-packages";
constexpr char DEFAULT_PROBE_HOST[] = "127.0.0.1";
constexpr char DEFAULT_SERVER_ADDRESS[] = "localhost";
constexpr char STANDALONE_SERVER_NAME[] = "clipbridge-server";
constexpr char STANDALONE_CLIENT_NAME[] = "clipbridge-client";

/// Stream handling
/// Size of a single read from a worker pipe
constexpr size_t STREAM_READ_CHUNK_SIZE = 4096;
/// Number of diagnostic lines kept for triage output
constexpr size_t DIAGNOSTIC_TAIL_LINES = 200;

/// Log markers emitted by the worker
constexpr char SERVER_READY_MARKER[] = "Server started successfully";
constexpr char CLIENT_READY_MARKER[] = "Connected to server successfully";

} // namespace ClipBridge

#endif // CLIPBRIDGE_COMMON_CONFIG_H_

#ifndef MCPHOST_PLATFORM_ABI_HPP
#define MCPHOST_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <map>
#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process with piped standard streams.
// On success the parent-side pipe ends are open and owned by the caller
// (normally handed straight to a ChildProcess).
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_fd = -1;   // parent writes, child reads
    int stdout_fd = -1;  // child writes, parent reads
    int stderr_fd = -1;  // child writes, parent reads
    int error_number = 0;
    std::string error_message;
};

// Spawn a child process, searching PATH for the executable.
// The child's environment is the host environment with environment_overlay
// applied on top (overlay entries replace host entries with the same key).
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          const std::map<std::string, std::string> &environment_overlay = {});

// Scoped owner of a spawned process and its pipes.
// Destroying (or terminate()-ing) it closes the pipes, asks the process to
// exit with SIGTERM and, after a grace period, kills and reaps it.
class ChildProcess {
public:
    ChildProcess() = default;
    explicit ChildProcess(const SpawnResult &spawned);
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;
    ChildProcess(ChildProcess &&other) noexcept;
    ChildProcess &operator=(ChildProcess &&other) noexcept;

    int process_id() const { return process_id_; }
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // True while a process is owned and has not been observed to exit.
    bool running();

    // Non-blocking check; reaps the process if it has exited.
    bool has_exited();

    // Exit code once exited (negative signal number if killed by a signal).
    int exit_status() const { return exit_status_; }

    // Stop the process and release every descriptor. Idempotent.
    void terminate(int grace_milliseconds = 2000);

private:
    void close_descriptors();
    void release();

    int process_id_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool exited_ = false;
    int exit_status_ = 0;
};

// True if the process exists and is not a zombie.
bool is_process_alive(int process_id);

// Wait (poll) for a child to exit, up to timeout_milliseconds. Reaps it.
// Returns true and fills exit_status if it exited in time.
bool wait_for_exit(int process_id, int timeout_milliseconds, int &exit_status);

// Send a signal (SIGTERM by default) to a process by its process ID.
bool kill_process(int process_id, int signal_number = 15);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Replace a file's contents. Returns false if the file cannot be written.
bool write_file_contents(const std::string &file_path, const std::string &contents);

// Writes to a pipe whose reader has gone away must fail with EPIPE instead of
// killing the host with SIGPIPE. Safe to call repeatedly.
void ignore_broken_pipe();

// Put a descriptor in O_NONBLOCK mode. Returns false if fcntl fails.
bool set_nonblocking(int file_descriptor);

} // namespace platform

#endif // MCPHOST_PLATFORM_ABI_HPP

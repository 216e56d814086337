#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

extern char **environ;

namespace platform {

static void close_if_open(int &descriptor) {
    if (descriptor != -1) {
        close(descriptor);
        descriptor = -1;
    }
}

static int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return status;
}

// Host environment with the overlay applied, as "KEY=VALUE" strings.
static std::vector<std::string> build_environment(const std::map<std::string, std::string> &overlay) {
    std::vector<std::string> entries;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string text(*entry);
        std::string key = text.substr(0, text.find('='));
        if (overlay.count(key) == 0) {
            entries.push_back(text);
        }
    }
    for (const auto &pair : overlay) {
        entries.push_back(pair.first + "=" + pair.second);
    }
    return entries;
}

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          const std::map<std::string, std::string> &environment_overlay) {
    SpawnResult result;

    int input_pipe[2] = {-1, -1};
    int output_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};
    if (pipe2(input_pipe, O_CLOEXEC) != 0 || pipe2(output_pipe, O_CLOEXEC) != 0 ||
        pipe2(error_pipe, O_CLOEXEC) != 0) {
        result.error_number = errno;
        result.error_message = "failed to create pipes: " + std::string(strerror(errno));
        close_if_open(input_pipe[0]);
        close_if_open(input_pipe[1]);
        close_if_open(output_pipe[0]);
        close_if_open(output_pipe[1]);
        close_if_open(error_pipe[0]);
        close_if_open(error_pipe[1]);
        return result;
    }

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    // We need mutable copies of strings for posix_spawn.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    std::vector<std::string> environment_strings = build_environment(environment_overlay);
    std::vector<char *> environment_pointers;
    for (auto &entry : environment_strings) {
        environment_pointers.push_back(entry.data());
    }
    environment_pointers.push_back(nullptr);

    // dup2 clears FD_CLOEXEC on the target, so only 0/1/2 survive the exec.
    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, input_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, output_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, error_pipe[1], STDERR_FILENO);

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, executable_path.c_str(), &file_actions, nullptr,
                                    argv_pointers.data(), environment_pointers.data());
    posix_spawn_file_actions_destroy(&file_actions);

    // The child's ends are no longer needed in the parent either way.
    close_if_open(input_pipe[0]);
    close_if_open(output_pipe[1]);
    close_if_open(error_pipe[1]);

    if (spawn_status != 0) {
        close_if_open(input_pipe[1]);
        close_if_open(output_pipe[0]);
        close_if_open(error_pipe[0]);
        result.error_number = spawn_status;
        result.error_message = "posix_spawnp failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_fd = input_pipe[1];
    result.stdout_fd = output_pipe[0];
    result.stderr_fd = error_pipe[0];
    return result;
}

// --- ChildProcess ---

ChildProcess::ChildProcess(const SpawnResult &spawned)
    : process_id_(spawned.success ? spawned.process_id : -1),
      stdin_fd_(spawned.stdin_fd),
      stdout_fd_(spawned.stdout_fd),
      stderr_fd_(spawned.stderr_fd) {}

ChildProcess::~ChildProcess() {
    terminate();
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept {
    *this = std::move(other);
}

ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept {
    if (this != &other) {
        terminate();
        process_id_ = other.process_id_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        exited_ = other.exited_;
        exit_status_ = other.exit_status_;
        other.release();
    }
    return *this;
}

void ChildProcess::release() {
    process_id_ = -1;
    stdin_fd_ = -1;
    stdout_fd_ = -1;
    stderr_fd_ = -1;
    exited_ = false;
    exit_status_ = 0;
}

void ChildProcess::close_descriptors() {
    close_if_open(stdin_fd_);
    close_if_open(stdout_fd_);
    close_if_open(stderr_fd_);
}

bool ChildProcess::has_exited() {
    if (process_id_ <= 0) {
        return true;
    }
    if (exited_) {
        return true;
    }
    int status = 0;
    pid_t waited = waitpid(static_cast<pid_t>(process_id_), &status, WNOHANG);
    if (waited == static_cast<pid_t>(process_id_)) {
        exited_ = true;
        exit_status_ = decode_wait_status(status);
    } else if (waited < 0 && errno == ECHILD) {
        exited_ = true;
    }
    return exited_;
}

bool ChildProcess::running() {
    return process_id_ > 0 && !has_exited();
}

void ChildProcess::terminate(int grace_milliseconds) {
    // Closing stdin first lets well-behaved servers exit on EOF.
    close_if_open(stdin_fd_);

    if (process_id_ > 0 && !has_exited()) {
        kill_process(process_id_, SIGTERM);
        int status = 0;
        if (wait_for_exit(process_id_, grace_milliseconds, status)) {
            exit_status_ = status;
        } else {
            kill_process(process_id_, SIGKILL);
            int raw_status = 0;
            waitpid(static_cast<pid_t>(process_id_), &raw_status, 0);
            exit_status_ = decode_wait_status(raw_status);
        }
        exited_ = true;
    }

    close_descriptors();
    process_id_ = -1;
}

// --- Free functions ---

bool is_process_alive(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    if (kill(static_cast<pid_t>(process_id), 0) != 0 && errno != EPERM) {
        return false;
    }

    // /proc/<pid>/stat: "pid (comm) S ..." where S is the state letter.
    std::string stat_contents;
    if (!read_file_contents("/proc/" + std::to_string(process_id) + "/stat", stat_contents)) {
        return true;
    }
    auto comm_end = stat_contents.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 >= stat_contents.size()) {
        return true;
    }
    return stat_contents[comm_end + 2] != 'Z';
}

bool wait_for_exit(int process_id, int timeout_milliseconds, int &exit_status) {
    if (process_id <= 0) {
        return false;
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    while (true) {
        int status = 0;
        pid_t waited = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
        if (waited == static_cast<pid_t>(process_id)) {
            exit_status = decode_wait_status(status);
            return true;
        }
        if (waited < 0 && errno != EINTR) {
            // Not our child (or already reaped).
            return !is_process_alive(process_id);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool kill_process(int process_id, int signal_number) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(static_cast<pid_t>(process_id), signal_number);
    return (kill_result == 0);
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool write_file_contents(const std::string &file_path, const std::string &contents) {
    std::ofstream file_stream(file_path, std::ios::out | std::ios::trunc);
    if (!file_stream.is_open()) {
        return false;
    }
    file_stream << contents;
    file_stream.flush();
    return static_cast<bool>(file_stream);
}

void ignore_broken_pipe() {
    static std::once_flag once;
    std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
}

bool set_nonblocking(int file_descriptor) {
    int flags = fcntl(file_descriptor, F_GETFL);
    if (flags < 0) {
        return false;
    }
    return (flags & O_NONBLOCK) != 0 || fcntl(file_descriptor, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // namespace platform

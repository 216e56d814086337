#include "mcp/mcp_protocol_handler.hpp"

#include "platform/platform_abi.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <utility>
#include <vector>

namespace mcp_protocol {

namespace {

// Upper bound on how long the reader sleeps, so stop requests are noticed quickly.
constexpr int kPollIntervalMilliseconds = 20;
constexpr std::size_t kReadChunkBytes = 64 * 1024;
constexpr std::size_t kLoggedFrameBytes = 200;
// Replies to server-originated requests are tiny; a server that cannot take
// one within this window is not reading its stdin.
constexpr int kReplyWriteMilliseconds = 1000;

RequestResult make_failure(ErrorKind kind, const std::string &message) {
    RequestResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

std::future<RequestResult> ready_future(RequestResult result) {
    std::promise<RequestResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

} // namespace

struct ProtocolHandler::EventQueue {
    std::mutex mutex;
    std::condition_variable wakeup;
    std::deque<std::function<void()>> events;
    bool stop_requested = false;
};

ProtocolHandler::ProtocolHandler(std::string label, int write_fd, int read_fd, int error_fd,
                                 int default_timeout_milliseconds)
    : label_(std::move(label)),
      write_fd_(write_fd),
      read_fd_(read_fd),
      error_fd_(error_fd),
      default_timeout_milliseconds_(default_timeout_milliseconds > 0 ? default_timeout_milliseconds
                                                                     : kDefaultTimeoutMilliseconds),
      events_(std::make_shared<EventQueue>()) {
    platform::ignore_broken_pipe();
    if (!platform::set_nonblocking(write_fd_)) {
        debug_log::warn("Could not make the input pipe of MCP server '" + label_ + "' non-blocking: " +
                        strerror(errno));
    }
    listener_thread_ = std::thread(run_events, events_);
}

ProtocolHandler::~ProtocolHandler() {
    close("protocol handler destroyed");
    {
        std::lock_guard<std::mutex> lock(events_->mutex);
        events_->stop_requested = true;
    }
    events_->wakeup.notify_all();
    if (on_listener_thread()) {
        // Last owner released inside a callback; the thread only uses the shared queue.
        listener_thread_.detach();
    } else if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
}

void ProtocolHandler::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (reader_thread_.joinable() || stop_requested_) {
        return;
    }
    reader_thread_ = std::thread([this] { reader_loop(); });
}

std::future<RequestResult> ProtocolHandler::send_request_async(const std::string &method, const json &params,
                                                               int timeout_milliseconds) {
    if (timeout_milliseconds < 0) {
        timeout_milliseconds = default_timeout_milliseconds_;
    }

    const std::int64_t request_id = next_request_id_++;
    const json id = request_id;
    const std::string key = json_rpc::id_key(id);
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    std::future<RequestResult> future;
    {
        // Registering before writing means a fast reply can never miss its entry.
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!open_) {
            return ready_future(make_failure(ErrorKind::NotConnected,
                                             "MCP server '" + label_ + "' is not connected"));
        }
        PendingRequest pending;
        pending.id = id;
        pending.method = method;
        pending.created_at = Clock::now();
        pending.deadline = deadline;
        future = pending.promise.get_future();
        pending_requests_.emplace(key, std::move(pending));
    }

    debug_log::log(label_ + " -> " + method + " (id=" + std::to_string(request_id) + ")");
    std::string write_error;
    switch (write_frame(frame_decoder::encode_frame(json_rpc::build_request(id, method, params)), deadline,
                        write_error)) {
    case WriteStatus::Written:
        break;
    case WriteStatus::Failed:
        complete_request(key, make_failure(ErrorKind::ConnectionClosed, "failed to write " + method +
                                                                            " request to MCP server '" + label_ +
                                                                            "': " + write_error));
        break;
    case WriteStatus::TimedOut:
        debug_log::warn(write_error);
        complete_request(key, make_failure(ErrorKind::Timeout, "MCP request timeout: " + method));
        break;
    case WriteStatus::Abandoned:
        debug_log::warn(write_error);
        complete_request(key, make_failure(ErrorKind::Timeout, "MCP request timeout: " + method));
        close(write_error);
        break;
    }
    return future;
}

RequestResult ProtocolHandler::send_request(const std::string &method, const json &params,
                                            int timeout_milliseconds) {
    return send_request_async(method, params, timeout_milliseconds).get();
}

bool ProtocolHandler::send_notification(const std::string &method, const json &params) {
    if (!is_open()) {
        return false;
    }
    debug_log::log(label_ + " -> notification " + method);
    std::string write_error;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(default_timeout_milliseconds_);
    WriteStatus status =
        write_frame(frame_decoder::encode_frame(json_rpc::build_notification(method, params)), deadline, write_error);
    if (status == WriteStatus::Written) {
        return true;
    }
    debug_log::warn("Failed to send " + method + " to MCP server '" + label_ + "': " + write_error);
    if (status == WriteStatus::Abandoned) {
        close(write_error);
    }
    return false;
}

ListenerHandle ProtocolHandler::subscribe_notifications(NotificationListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    ListenerHandle handle = next_listener_handle_++;
    notification_listeners_.emplace(handle, std::move(listener));
    return handle;
}

void ProtocolHandler::unsubscribe_notifications(ListenerHandle handle) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    notification_listeners_.erase(handle);
}

void ProtocolHandler::set_close_listener(CloseListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    close_listener_ = std::move(listener);
}

void ProtocolHandler::clear_listeners() {
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        notification_listeners_.clear();
        close_listener_ = nullptr;
    }
    wait_for_events();
}

void ProtocolHandler::close(const std::string &reason) {
    stop_requested_ = true;

    if (std::this_thread::get_id() == reader_thread_.get_id()) {
        // The reader gave up on a write; the loop exits once this returns.
        fail_all_pending(ErrorKind::ConnectionClosed, reason);
        notify_closed(reason);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (reader_thread_.joinable()) {
            reader_thread_.join();
        }
    }

    fail_all_pending(ErrorKind::ConnectionClosed, reason);
    output_decoder_.reset();
    error_decoder_.reset();
    notify_closed(reason);
    wait_for_events();
}

bool ProtocolHandler::is_open() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return open_;
}

std::size_t ProtocolHandler::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_requests_.size();
}

// --- Reader thread ---

void ProtocolHandler::reader_loop() {
    bool error_stream_open = error_fd_ >= 0;

    while (!stop_requested_) {
        std::array<struct pollfd, 2> poll_descriptors{};
        poll_descriptors[0].fd = read_fd_;
        poll_descriptors[0].events = POLLIN;
        nfds_t descriptor_count = 1;
        if (error_stream_open) {
            poll_descriptors[1].fd = error_fd_;
            poll_descriptors[1].events = POLLIN;
            descriptor_count = 2;
        }

        int poll_result = poll(poll_descriptors.data(), descriptor_count, next_poll_timeout());
        if (poll_result < 0 && errno != EINTR) {
            std::string reason = "poll on MCP server '" + label_ + "' failed: " + strerror(errno);
            fail_all_pending(ErrorKind::ConnectionClosed, reason);
            notify_closed(reason);
            return;
        }

        if (poll_result > 0) {
            // Drain stderr first so a crash message is logged before the EOF.
            if (error_stream_open && (poll_descriptors[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                std::array<char, 4096> buffer{};
                ssize_t bytes = read(error_fd_, buffer.data(), buffer.size());
                if (bytes > 0) {
                    for (const auto &line : error_decoder_.feed(buffer.data(), static_cast<std::size_t>(bytes))) {
                        debug_log::log(label_ + " stderr: " + line);
                    }
                } else if (bytes == 0 || (errno != EINTR && errno != EAGAIN)) {
                    error_stream_open = false;
                }
            }

            if ((poll_descriptors[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                if (!read_output()) {
                    return;
                }
            }
        }

        expire_overdue_requests();
    }
}

// Returns false once the output stream has ended.
bool ProtocolHandler::read_output() {
    std::vector<char> buffer(kReadChunkBytes);
    ssize_t bytes = read(read_fd_, buffer.data(), buffer.size());
    if (bytes > 0) {
        for (const auto &frame : output_decoder_.feed(buffer.data(), static_cast<std::size_t>(bytes))) {
            handle_frame(frame);
        }
        return true;
    }
    if (bytes < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }

    std::string reason = bytes == 0 ? "MCP server '" + label_ + "' closed its output stream"
                                    : "read from MCP server '" + label_ + "' failed: " + strerror(errno);
    debug_log::log(reason);
    output_decoder_.reset();
    fail_all_pending(ErrorKind::ConnectionClosed, reason);
    notify_closed(reason);
    return false;
}

void ProtocolHandler::handle_frame(const std::string &frame) {
    json message;
    try {
        message = json::parse(frame);
    } catch (const json::parse_error &parse_error) {
        ++malformed_frames_;
        debug_log::warn("Failed to parse MCP message from '" + label_ + "': " + parse_error.what() +
                        ", frame: " + frame.substr(0, kLoggedFrameBytes));
        return;
    }

    if (json_rpc::is_response(message)) {
        const json id = json_rpc::get_id(message);
        RequestResult result;
        if (message.contains("error") && !message["error"].is_null()) {
            result.error_kind = ErrorKind::RemoteError;
            result.error = message["error"];
            result.error_message = json_rpc::describe_error(message["error"]);
        } else {
            result.success = true;
            result.result = message["result"];
        }
        if (!complete_request(json_rpc::id_key(id), std::move(result))) {
            debug_log::log(label_ + ": dropping response for unknown id " + id.dump());
        }
        return;
    }

    if (json_rpc::is_notification(message)) {
        dispatch_notification(json_rpc::get_method(message), json_rpc::get_params(message));
        return;
    }

    if (message.is_object() && message.contains("id") && message.contains("method")) {
        handle_server_request(message);
        return;
    }

    ++malformed_frames_;
    debug_log::warn("Ignoring unrecognised MCP message from '" + label_ +
                    "': " + frame.substr(0, kLoggedFrameBytes));
}

// Requests flowing server -> client. Only ping is supported.
void ProtocolHandler::handle_server_request(const json &message) {
    const json id = json_rpc::get_id(message);
    const std::string method = json_rpc::get_method(message);
    json reply;
    if (method == "ping") {
        reply = json_rpc::build_response(id, json::object());
    } else {
        reply = json_rpc::build_error_response(id, json_rpc::METHOD_NOT_FOUND, "Unknown method: " + method);
    }
    std::string write_error;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(kReplyWriteMilliseconds);
    WriteStatus status = write_frame(frame_decoder::encode_frame(reply), deadline, write_error);
    if (status != WriteStatus::Written) {
        debug_log::log(label_ + ": failed to answer server request " + method + ": " + write_error);
    }
    if (status == WriteStatus::Abandoned) {
        close(write_error);
    }
}

void ProtocolHandler::dispatch_notification(const std::string &method, const json &params) {
    debug_log::log(label_ + " <- notification " + method);

    std::vector<NotificationListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        for (const auto &entry : notification_listeners_) {
            listeners.push_back(entry.second);
        }
    }
    if (listeners.empty()) {
        return;
    }
    post_event([listeners, label = label_, method, params] {
        for (const auto &listener : listeners) {
            try {
                listener(method, params);
            } catch (const std::exception &error) {
                debug_log::warn("Error in MCP notification listener for '" + label + "': " + error.what());
            }
        }
    });
}

// Whoever removes the entry settles it, so each request completes exactly once.
bool ProtocolHandler::complete_request(const std::string &key, RequestResult result) {
    std::promise<RequestResult> promise;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto iterator = pending_requests_.find(key);
        if (iterator == pending_requests_.end()) {
            return false;
        }
        promise = std::move(iterator->second.promise);
        pending_requests_.erase(iterator);
    }
    promise.set_value(std::move(result));
    return true;
}

void ProtocolHandler::expire_overdue_requests() {
    std::vector<PendingRequest> expired;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        const auto now = Clock::now();
        for (auto iterator = pending_requests_.begin(); iterator != pending_requests_.end();) {
            if (iterator->second.deadline <= now) {
                expired.push_back(std::move(iterator->second));
                iterator = pending_requests_.erase(iterator);
            } else {
                ++iterator;
            }
        }
    }
    for (auto &pending : expired) {
        debug_log::log(label_ + ": request " + pending.id.dump() + " (" + pending.method + ") timed out");
        pending.promise.set_value(make_failure(ErrorKind::Timeout, "MCP request timeout: " + pending.method));
    }
}

void ProtocolHandler::fail_all_pending(ErrorKind kind, const std::string &message) {
    std::map<std::string, PendingRequest> orphaned;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        open_ = false;
        orphaned.swap(pending_requests_);
    }
    for (auto &entry : orphaned) {
        entry.second.promise.set_value(make_failure(kind, message));
    }
}

void ProtocolHandler::notify_closed(const std::string &reason) {
    if (close_notified_.exchange(true)) {
        return;
    }
    CloseListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = close_listener_;
    }
    if (!listener) {
        return;
    }
    post_event([listener, label = label_, reason] {
        try {
            listener(reason);
        } catch (const std::exception &error) {
            debug_log::warn("Error in MCP close listener for '" + label + "': " + error.what());
        }
    });
}

// --- Listener thread ---

void ProtocolHandler::post_event(std::function<void()> event) {
    {
        std::lock_guard<std::mutex> lock(events_->mutex);
        events_->events.push_back(std::move(event));
    }
    events_->wakeup.notify_one();
}

// Block until every callback queued so far has run.
void ProtocolHandler::wait_for_events() {
    if (on_listener_thread()) {
        return;
    }
    std::promise<void> drained;
    std::future<void> done = drained.get_future();
    post_event([&drained] { drained.set_value(); });
    done.wait();
}

bool ProtocolHandler::on_listener_thread() const {
    return std::this_thread::get_id() == listener_thread_.get_id();
}

// Runs until stopped and drained.
void ProtocolHandler::run_events(std::shared_ptr<EventQueue> queue) {
    for (;;) {
        std::function<void()> event;
        {
            std::unique_lock<std::mutex> lock(queue->mutex);
            queue->wakeup.wait(lock, [&queue] { return queue->stop_requested || !queue->events.empty(); });
            if (queue->events.empty()) {
                return;
            }
            event = std::move(queue->events.front());
            queue->events.pop_front();
        }
        event();
    }
}

// --- Writing ---

ProtocolHandler::WriteStatus ProtocolHandler::write_frame(const std::string &frame, Clock::time_point deadline,
                                                          std::string &error_message) {
    std::unique_lock<std::timed_mutex> lock(write_mutex_, deadline);
    if (!lock.owns_lock()) {
        error_message = "an earlier write to MCP server '" + label_ + "' is still blocked";
        return WriteStatus::TimedOut;
    }

    std::size_t written_total = 0;
    while (written_total < frame.size()) {
        ssize_t written = write(write_fd_, frame.data() + written_total, frame.size() - written_total);
        if (written >= 0) {
            written_total += static_cast<std::size_t>(written);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            error_message = strerror(errno);
            return WriteStatus::Failed;
        }

        // The pipe is full: wait for the server to drain it, up to the deadline.
        if (stop_requested_) {
            error_message = "connection closed";
            return WriteStatus::Failed;
        }
        const long long remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0) {
            error_message = "MCP server '" + label_ + "' is not reading its input (" +
                            std::to_string(written_total) + " of " + std::to_string(frame.size()) +
                            " bytes written)";
            return written_total > 0 ? WriteStatus::Abandoned : WriteStatus::TimedOut;
        }
        struct pollfd descriptor = {write_fd_, POLLOUT, 0};
        int ready = poll(&descriptor, 1, static_cast<int>(std::min<long long>(remaining, kPollIntervalMilliseconds)));
        if (ready < 0 && errno != EINTR) {
            error_message = strerror(errno);
            return WriteStatus::Failed;
        }
        if (ready > 0 && (descriptor.revents & POLLOUT) == 0 && (descriptor.revents & (POLLERR | POLLHUP)) != 0) {
            error_message = "MCP server '" + label_ + "' closed its input";
            return WriteStatus::Failed;
        }
    }
    return WriteStatus::Written;
}

int ProtocolHandler::next_poll_timeout() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    int timeout = kPollIntervalMilliseconds;
    const auto now = Clock::now();
    for (const auto &entry : pending_requests_) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(entry.second.deadline - now).count();
        timeout = std::min<int>(timeout, static_cast<int>(std::max<long long>(remaining, 0)));
    }
    return timeout;
}

} // namespace mcp_protocol

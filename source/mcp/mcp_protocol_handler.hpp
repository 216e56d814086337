#ifndef MCPHOST_MCP_PROTOCOL_HANDLER_HPP
#define MCPHOST_MCP_PROTOCOL_HANDLER_HPP

// JSON-RPC request/response correlation over a child process's stdio pipes.
//
// One reader thread per handler drives everything that happens on the
// connection: it reads the server's stdout, splits it into frames, resolves
// pending requests by id, forwards the server's stderr to the debug log and
// expires requests whose deadline passed. Listener callbacks run on a second
// thread, in arrival order, so a listener may itself send requests.
// Callers may issue requests from any thread; responses are matched purely by
// id, so they may arrive in any order. Writes never block past the request
// deadline: the write end of the pipe is switched to non-blocking mode.

#include "mcp/mcp_errors.hpp"
#include "protocol/frame_decoder.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcp_protocol {

using json = nlohmann::json;
using mcp_errors::ErrorKind;

// Outcome of one request. On success `result` holds the response's "result"
// member; on RemoteError `error` holds the response's "error" object.
struct RequestResult {
    bool success = false;
    json result;
    json error;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

using NotificationListener = std::function<void(const std::string &method, const json &params)>;
using CloseListener = std::function<void(const std::string &reason)>;
using ListenerHandle = std::uint64_t;

class ProtocolHandler {
public:
    static constexpr int kDefaultTimeoutMilliseconds = 30000;

    // The descriptors stay owned by the caller and must outlive close().
    // error_fd may be -1 when the server's stderr is not captured. write_fd is
    // put in non-blocking mode.
    ProtocolHandler(std::string label, int write_fd, int read_fd, int error_fd = -1,
                    int default_timeout_milliseconds = kDefaultTimeoutMilliseconds);
    ~ProtocolHandler();

    ProtocolHandler(const ProtocolHandler &) = delete;
    ProtocolHandler &operator=(const ProtocolHandler &) = delete;

    // Start the reader thread. Requests sent before start() stay pending.
    void start();

    // Send a request with a fresh id. The future completes exactly once: with
    // the matching response, with Timeout once timeout_milliseconds pass
    // (negative = handler default), or with ConnectionClosed when the stream
    // ends or close() is called. A closed handler yields NotConnected at once.
    // If the server stops reading its stdin mid-frame the request times out
    // and the handler closes, since the stream can no longer be framed.
    std::future<RequestResult> send_request_async(const std::string &method, const json &params,
                                                  int timeout_milliseconds = -1);

    // Blocking form of send_request_async.
    RequestResult send_request(const std::string &method, const json &params,
                               int timeout_milliseconds = -1);

    // Fire-and-forget. Returns false if the handler is closed or the write failed.
    bool send_notification(const std::string &method, const json &params = json::object());

    ListenerHandle subscribe_notifications(NotificationListener listener);
    void unsubscribe_notifications(ListenerHandle handle);

    // Called once, on the listener thread, when the connection ends.
    void set_close_listener(CloseListener listener);

    // Drop every listener and wait for callbacks already queued to finish.
    // Does not wait when called from inside a callback.
    void clear_listeners();

    // Stop reading and reject every outstanding request with ConnectionClosed.
    // Returns after the close listener ran, unless called from a callback.
    // Idempotent.
    void close(const std::string &reason = "connection closed");

    bool is_open() const;
    std::size_t pending_count() const;
    std::size_t malformed_frame_count() const { return malformed_frames_.load(); }
    const std::string &label() const { return label_; }

private:
    using Clock = std::chrono::steady_clock;

    enum class WriteStatus {
        Written,
        Failed,    // the pipe is broken or the handler is closing
        TimedOut,  // nothing of the frame was written
        Abandoned, // part of the frame was written; the stream is corrupt
    };

    // Listener callbacks waiting to run. Shared with the listener thread,
    // which touches nothing else, so the handler may be destroyed from a callback.
    struct EventQueue;

    struct PendingRequest {
        json id;
        std::string method;
        Clock::time_point created_at;
        Clock::time_point deadline;
        std::promise<RequestResult> promise;
    };

    void reader_loop();
    bool read_output();
    void read_error_stream();
    void handle_frame(const std::string &frame);
    void handle_server_request(const json &message);
    void dispatch_notification(const std::string &method, const json &params);
    bool complete_request(const std::string &key, RequestResult result);
    void expire_overdue_requests();
    void fail_all_pending(ErrorKind kind, const std::string &message);
    void notify_closed(const std::string &reason);
    WriteStatus write_frame(const std::string &frame, Clock::time_point deadline, std::string &error_message);
    void post_event(std::function<void()> event);
    void wait_for_events();
    bool on_listener_thread() const;
    static void run_events(std::shared_ptr<EventQueue> queue);
    int next_poll_timeout() const;

    std::string label_;
    int write_fd_;
    int read_fd_;
    int error_fd_;
    int default_timeout_milliseconds_;

    mutable std::mutex pending_mutex_;
    std::map<std::string, PendingRequest> pending_requests_;
    bool open_ = true; // guarded by pending_mutex_

    std::timed_mutex write_mutex_;

    std::mutex listener_mutex_;
    std::map<ListenerHandle, NotificationListener> notification_listeners_;
    ListenerHandle next_listener_handle_ = 1;
    CloseListener close_listener_;
    std::atomic<bool> close_notified_{false};

    std::atomic<std::int64_t> next_request_id_{1};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::size_t> malformed_frames_{0};
    std::thread reader_thread_;
    std::mutex lifecycle_mutex_;

    std::shared_ptr<EventQueue> events_;
    std::thread listener_thread_;

    frame_decoder::FrameDecoder output_decoder_;
    frame_decoder::FrameDecoder error_decoder_;
};

} // namespace mcp_protocol

#endif // MCPHOST_MCP_PROTOCOL_HANDLER_HPP

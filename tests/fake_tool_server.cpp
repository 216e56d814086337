// Scriptable tool server used by the process-level tests.
//
// Speaks newline-delimited JSON-RPC on stdin/stdout. Exposes a "read" tool by
// default; behaviour is selected with flags:
//   --stdio                    accepted and ignored
//   --extra-tools              also expose "echo" and "fail"
//   --exit-immediately <code>  exit before reading anything
//   --fail-initialize          answer initialize with an error
//   --exit-after-init          exit once notifications/initialized arrives
//   --exit-on-call             exit when tools/call arrives
//   --never-reply <method>     swallow requests for this method
//   --garbage                  emit an unparsable line and a notification after initialize
//   --stderr                   write a diagnostic line to stderr at startup
//   --log <path>               append every received method name to path
//   --single-start <path>      exit with code 1 if path exists, else create it

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <string>

using json = nlohmann::json;

namespace {

struct Options {
    bool extra_tools = false;
    int exit_immediately_code = -1;
    bool fail_initialize = false;
    bool exit_after_init = false;
    bool exit_on_call = false;
    bool garbage = false;
    bool write_stderr = false;
    std::set<std::string> never_reply;
    std::string log_path;
    std::string single_start_path;
};

void send(const json &message) {
    std::cout << message.dump() << "\n";
    std::cout.flush();
}

void send_result(const json &id, const json &result) {
    send({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
}

void send_error(const json &id, int code, const std::string &message) {
    send({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
}

json text_content(const std::string &text) {
    return json::array({{{"type", "text"}, {"text", text}}});
}

json tool_list(const Options &options) {
    json tools = json::array();
    tools.push_back({{"name", "read"},
                     {"description", "Read a file"},
                     {"inputSchema",
                      {{"type", "object"},
                       {"properties", {{"path", {{"type", "string"}}}}},
                       {"required", json::array({"path"})}}}});
    if (options.extra_tools) {
        tools.push_back({{"name", "echo"},
                         {"inputSchema",
                          {{"type", "object"},
                           {"properties",
                            {{"text", {{"type", "string"}, {"description", "Text to echo"}}},
                             {"count", {{"type", "integer"}, {"default", 1}}},
                             {"loud", {{"type", "boolean"}}},
                             {"tags", {{"type", "array"}}}}},
                           {"required", json::array({"text"})}}}});
        tools.push_back({{"name", "fail"}, {"description", "Always reports an error"}});
    }
    return tools;
}

json call_tool(const json &params) {
    const std::string name = params.value("name", "");
    const json arguments =
        params.contains("arguments") && params["arguments"].is_object() ? params["arguments"] : json::object();

    if (name == "read") {
        if (!arguments.contains("path") || !arguments["path"].is_string()) {
            return {{"content", text_content("missing path")}, {"isError", true}};
        }
        return {{"content", text_content("hello")}, {"isError", false}};
    }
    if (name == "echo") {
        std::string text = arguments.value("text", "");
        int count = arguments.value("count", 1);
        std::string output;
        for (int index = 0; index < count; ++index) {
            output += text;
        }
        return {{"content", text_content(output)}};
    }
    if (name == "fail") {
        return {{"content", text_content("boom")}, {"isError", true}};
    }
    return {{"content", text_content("Unknown tool: " + name)}, {"isError", true}};
}

} // namespace

int main(int argc, char *argv[]) {
    Options options;
    for (int index = 1; index < argc; ++index) {
        std::string argument = argv[index];
        if (argument == "--extra-tools") {
            options.extra_tools = true;
        } else if (argument == "--exit-immediately" && index + 1 < argc) {
            options.exit_immediately_code = std::atoi(argv[++index]);
        } else if (argument == "--fail-initialize") {
            options.fail_initialize = true;
        } else if (argument == "--exit-after-init") {
            options.exit_after_init = true;
        } else if (argument == "--exit-on-call") {
            options.exit_on_call = true;
        } else if (argument == "--never-reply" && index + 1 < argc) {
            options.never_reply.insert(argv[++index]);
        } else if (argument == "--garbage") {
            options.garbage = true;
        } else if (argument == "--stderr") {
            options.write_stderr = true;
        } else if (argument == "--log" && index + 1 < argc) {
            options.log_path = argv[++index];
        } else if (argument == "--single-start" && index + 1 < argc) {
            options.single_start_path = argv[++index];
        }
    }

    if (options.exit_immediately_code >= 0) {
        return options.exit_immediately_code;
    }
    if (!options.single_start_path.empty()) {
        if (std::ifstream(options.single_start_path).good()) {
            return 1;
        }
        std::ofstream(options.single_start_path) << "started\n";
    }
    if (options.write_stderr) {
        std::cerr << "fake tool server starting" << std::endl;
    }

    std::ofstream log_file;
    if (!options.log_path.empty()) {
        log_file.open(options.log_path, std::ios::app);
    }

    bool initialized = false;
    std::string line;
    while (std::getline(std::cin, line)) {
        json message;
        try {
            message = json::parse(line);
        } catch (const json::parse_error &) {
            send_error(nullptr, -32700, "Parse error");
            continue;
        }

        if (!message.is_object()) {
            send_error(nullptr, -32600, "Invalid Request");
            continue;
        }
        const std::string method = message.value("method", "");
        const json id = message.contains("id") ? message["id"] : json();
        const json params =
            message.contains("params") && message["params"].is_object() ? message["params"] : json::object();
        if (log_file.is_open()) {
            log_file << method << std::endl;
        }

        if (method == "notifications/initialized") {
            initialized = true;
            if (options.exit_after_init) {
                return 0;
            }
            continue;
        }
        if (id.is_null() || options.never_reply.count(method) > 0) {
            continue;
        }

        if (method == "initialize") {
            if (options.fail_initialize) {
                send_error(id, -32603, "initialization refused");
                continue;
            }
            send_result(id, {{"protocolVersion", params.value("protocolVersion", "2025-06-18")},
                             {"capabilities", {{"tools", json::object()}}},
                             {"serverInfo", {{"name", "fake-tool-server"}, {"version", "1.0.0"}}},
                             {"instructions", "Test server"}});
            if (options.garbage) {
                std::cout << "this is not json" << std::endl;
                send({{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"level", "info"}}}});
            }
        } else if (method == "ping") {
            send_result(id, json::object());
        } else if (!initialized) {
            send_error(id, -32002, "Server not initialized");
        } else if (method == "tools/list") {
            send_result(id, {{"tools", tool_list(options)}});
        } else if (method == "tools/call") {
            if (options.exit_on_call) {
                return 3;
            }
            send_result(id, call_tool(params));
        } else {
            send_error(id, -32601, "Method not found: " + method);
        }
    }
    return 0;
}

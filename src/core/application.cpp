/*
 * sandcell - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <sandcell/core/application.hpp>
#include <sandcell/core/logger.hpp>
#include <sandcell/core/utils.hpp>
#include <sandcell/sandbox/code_sandbox_tool.hpp>
#include <sandcell/sandbox/confinement.hpp>
#include <sandcell/sandbox/worker.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <unistd.h>

namespace sandcell {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cerr << AppInfo::NAME << " - Restricted Python execution tool server\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config FILE  Configuration file (default: config.json)\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Protocol (one JSON document per line):\n"
              << "  stdin:  {\"id\": 1, \"tool\": \"execute_code\", \"arguments\": {\"source\": \"print(1)\"}}\n"
              << "  stdout: {\"id\": 1, \"tool\": \"execute_code\", \"ok\": true, \"result\": {...}}\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
}

Json error_response(const Json& id, const std::string& error) {
    Json r;
    r["id"] = id;
    r["ok"] = false;
    r["error"] = error;
    return r;
}

} // namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , config_file_("config.json")
    , config_explicit_(false)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            config_explicit_ = true;
            continue;
        }
        LOG_WARN("Ignoring unknown argument: %s", argv[i]);
    }
    return true;
}

bool Application::load_config() {
    if (config_.load_file(config_file_)) {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    } else if (config_explicit_) {
        LOG_ERROR("Failed to load config from %s, aborting!", config_file_.c_str());
        return false;
    } else {
        LOG_WARN("No usable %s, using built-in defaults", config_file_.c_str());
    }

    int overrides = config_.apply_env_overrides();
    if (overrides > 0) {
        LOG_INFO("Applied %d environment override(s)", overrides);
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));

    std::string log_file = config_.get_string("log_file", "");
    if (!log_file.empty() && !Logger::instance().set_output_file(log_file)) {
        LOG_WARN("Cannot open log file %s, logging to stderr only", log_file.c_str());
    }
}

bool Application::setup_tools() {
    std::unique_ptr<ToolProvider> sandbox_tool(new CodeSandboxTool());
    if (!sandbox_tool->init(config_)) {
        LOG_ERROR("Failed to initialize tool provider: %s", sandbox_tool->name());
        return false;
    }
    providers_.push_back(std::move(sandbox_tool));

    size_t action_count = 0;
    for (size_t i = 0; i < providers_.size(); ++i) {
        action_count += providers_[i]->actions().size();
    }
    LOG_INFO("Registered %zu tool provider(s) with %zu action(s)", providers_.size(), action_count);
    return true;
}

void Application::check_confinement() {
    RuntimeSettings settings = RuntimeSettings::from_config(config_);

    if (access(settings.launcher_path.c_str(), X_OK) != 0) {
        LOG_WARN("[Sandbox] Launcher %s is not executable: every execution will fail",
                 settings.launcher_path.c_str());
    }
    if (access(settings.python_path.c_str(), X_OK) != 0) {
        LOG_WARN("[Sandbox] Interpreter %s is not executable: every execution will fail",
                 settings.python_path.c_str());
    }

    ConfinementSupport support = detect_confinement();
    if (support.landlock) {
        LOG_INFO("[Sandbox] Landlock ABI v%d available", support.landlock_abi);
    } else {
        LOG_WARN("[Sandbox] Landlock not available (Linux >= 5.13 required)");
    }
    if (!support.seccomp) {
        LOG_WARN("[Sandbox] seccomp filtering not available");
    }

    if (!support.landlock || !support.seccomp) {
        if (settings.require_confinement) {
            LOG_ERROR("[Sandbox] sandbox.require_confinement is set: executions will fail on this kernel");
        } else {
            LOG_WARN("[Sandbox] Executions run with resource limits only. Set sandbox.require_confinement to refuse instead.");
        }
    }
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    // No SA_RESTART: a signal interrupts the blocking stdin read
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    // Children that exit before reading their request must not kill us
    signal(SIGPIPE, SIG_IGN);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!load_config()) {
        running_ = false;
        return false;
    }

    setup_logging();

    if (!setup_tools()) {
        running_ = false;
        return false;
    }

    check_confinement();

    int64_t workers = clamp<int64_t>(config_.get_int("server.workers", 4), 1, 64);
    thread_pool_.reset(new ThreadPool(static_cast<size_t>(workers)));
    LOG_INFO("Request pool: %lld worker(s)", (long long)workers);

    return true;
}

ToolProvider* Application::find_provider(const std::string& action) const {
    for (size_t i = 0; i < providers_.size(); ++i) {
        if (providers_[i]->is_initialized() && providers_[i]->has_action(action)) {
            return providers_[i].get();
        }
    }
    return nullptr;
}

Json Application::handle_request(const Json& request) {
    if (!request.is_object()) {
        return error_response(nullptr, "Request must be a JSON object");
    }

    Json id = request.contains("id") ? request["id"] : Json(nullptr);

    if (!request.contains("tool") || !request["tool"].is_string()) {
        return error_response(id, "Missing required field: tool");
    }
    std::string tool = request["tool"].get<std::string>();

    Json response;
    response["id"] = id;
    response["tool"] = tool;

    if (tool == "list_tools") {
        Json tools = Json::array();
        for (size_t i = 0; i < providers_.size(); ++i) {
            std::vector<ToolSpec> specs = providers_[i]->get_tool_specs();
            for (size_t j = 0; j < specs.size(); ++j) {
                tools.push_back(specs[j].to_json());
            }
        }
        response["ok"] = true;
        response["result"] = {{"tools", tools}};
        return response;
    }

    ToolProvider* provider = find_provider(tool);
    if (!provider) {
        return error_response(id, "Unknown tool: " + tool);
    }

    Json arguments = request.contains("arguments") ? request["arguments"] : Json::object();
    if (arguments.is_null()) arguments = Json::object();

    ToolResult result = provider->execute(tool, arguments);
    if (!result.success) {
        Json r = error_response(id, result.error);
        r["tool"] = tool;
        return r;
    }

    response["ok"] = true;
    response["result"] = result.data;
    return response;
}

void Application::write_response(const Json& response) {
    std::string line = response.dump(-1, ' ', false, Json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << line << "\n";
    std::cout.flush();
}

void Application::dispatch_line(const std::string& line) {
    Json request = Json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        LOG_WARN("Invalid JSON request (%zu bytes)", line.size());
        write_response(error_response(nullptr, "Invalid JSON request"));
        return;
    }

    bool queued = thread_pool_->enqueue([this, request]() {
        Json response;
        try {
            response = handle_request(request);
        } catch (const std::exception& e) {
            LOG_ERROR("Request failed: %s", e.what());
            Json id = (request.is_object() && request.contains("id")) ? request["id"] : Json(nullptr);
            response = error_response(id, std::string("Internal error: ") + e.what());
        }
        write_response(response);
    });

    if (!queued) {
        Json id = (request.is_object() && request.contains("id")) ? request["id"] : Json(nullptr);
        write_response(error_response(id, "Server is shutting down"));
    }
}

int Application::run() {
    LOG_INFO("Serving JSON requests on stdin");

    std::string line;
    size_t served = 0;
    while (running_.load() && std::getline(std::cin, line)) {
        if (trim(line).empty()) continue;
        dispatch_line(line);
        ++served;
    }

    if (!running_.load()) {
        LOG_INFO("Received shutdown signal");
    } else {
        LOG_INFO("End of input after %zu request(s)", served);
    }
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    // Finish queued requests so every request gets its response
    if (thread_pool_) {
        LOG_DEBUG("[App] Stopping thread pool (pending: %zu)", thread_pool_->pending());
        thread_pool_->shutdown();
        thread_pool_.reset();
        LOG_DEBUG("[App] Thread pool stopped");
    }

    for (size_t i = 0; i < providers_.size(); ++i) {
        providers_[i]->shutdown();
    }
    providers_.clear();

    LOG_INFO("Goodbye!");
}

} // namespace sandcell

/*
 * sandcell - Application
 *
 * Process-wide singleton owning the configuration, the tool providers and
 * the request thread pool. Serves tool calls as JSON lines on stdin/stdout:
 *
 *   request:  {"id": any, "tool": "execute_code", "arguments": {...}}
 *             {"id": any, "tool": "list_tools"}
 *   response: {"id", "tool", "ok": true, "result": {...}}
 *             {"id", "ok": false, "error": "..."}
 *
 * Requests run concurrently, so responses may arrive out of order.
 */
#ifndef sandcell_CORE_APPLICATION_HPP
#define sandcell_CORE_APPLICATION_HPP

#include <sandcell/core/config.hpp>
#include <sandcell/core/json.hpp>
#include <sandcell/core/thread_pool.hpp>
#include <sandcell/core/tool.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sandcell {

struct AppInfo {
    static constexpr const char* NAME = "sandcell";
    static constexpr const char* VERSION = "1.0.0";
};

class Application {
public:
    static Application& instance();

    // Returns false for --help/--version (is_running() stays true) or on
    // fatal errors (is_running() false)
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }

    // One request document in, one response document out
    Json handle_request(const Json& request);

    Config& config() { return config_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_tools();
    void check_confinement();

    void dispatch_line(const std::string& line);
    void write_response(const Json& response);
    ToolProvider* find_provider(const std::string& action) const;

    std::atomic<bool> running_;
    Config config_;
    std::string config_file_;
    bool config_explicit_;
    std::unique_ptr<ThreadPool> thread_pool_;
    std::vector<std::unique_ptr<ToolProvider> > providers_;
    std::mutex output_mutex_;
};

} // namespace sandcell

#endif // sandcell_CORE_APPLICATION_HPP

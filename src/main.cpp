/*
 * sandcell - Restricted Python execution tool server
 *
 * Usage:
 *   ./sandcell [--config config.json]
 *
 * Reads one JSON tool call per line on stdin and writes one JSON response
 * per line on stdout. Logs go to stderr.
 */
#include <sandcell/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = sandcell::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.is_running() ? 0 : 1;
    }

    int result = app.run();
    app.shutdown();

    return result;
}

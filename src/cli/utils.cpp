#include "utils.hpp"

#include "build/build_request.hpp"
#include "common.hpp"

#include <iostream>

namespace pypack::cli {

void print_usage() {
    std::cout << "pypack " << VERSION << "\n\n";
    std::cout << "Usage: pypack <source.py> [options]\n\n";
    std::cout << "Packages a Python entry file and the local modules it imports.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -o, --output <dir>    Output directory (default: current directory)\n";
    std::cout << "  -f, --format <fmt>    pyd, so, exe or zip (default: "
              << build::default_format_spelling() << ")\n";
    std::cout << "  --no-deps             Package only the entry file\n";
    std::cout << "  --no-optimize         Build without optimizations\n";
    std::cout << "  -b, --banner <file>   Embed the file's bytes in every artifact\n";
    std::cout << "  -j, --jobs <n>        Parallel backend steps (default: CPU count)\n";
    std::cout << "  --python <exe>        Interpreter driving Cython/PyInstaller\n";
    std::cout << "  --timeout <sec>       Per-step time limit (0 = none)\n";
    std::cout << "  --no-cache            Rebuild everything\n";
    std::cout << "  --keep-temp           Keep intermediate build directories\n";
    std::cout << "  --config <file>       Read defaults from <file> instead of pypack.toml\n";
    std::cout << "  --dry-run             Print the dependency graph and plan only\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -V, --version         Show version\n";
    std::cout << "\nLogging:\n";
    std::cout << "  -v, -vv, -vvv         Info, debug, trace output on stderr\n";
    std::cout << "  -q, --quiet           Errors only\n";
    std::cout << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>   Per-module levels, e.g. deps=trace,*=warn\n";
    std::cout << "  --log-file=<path>     Also write log records to <path>\n";
    std::cout << "  --log-format=<fmt>    text or json\n";
    std::cout << "\nExit status:\n";
    std::cout << "  0 success, 1 unit failed, 2 configuration error, 3 backend missing,\n";
    std::cout << "  130 interrupted\n";
}

void print_version() {
    std::cout << "pypack " << VERSION << "\n";
}

} // namespace pypack::cli

/// Calculator server: registers a few typed tools and answers one JSON-RPC
/// request per stdin line with one response line on stdout.
/// Usage: ./calculator_server [log-level] < requests.jsonl

#include <mcplite/mcplite.hpp>
#include <algorithm>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    mcplite::McpServer::Options opts;
    opts.server_info = {"Calculator Server", std::nullopt, "1.0.0"};
    opts.log_level = mcplite::LogLevel::Warning;
    if (argc > 1) {
        try {
            opts.log_level = mcplite::log_level_from_string(argv[1]);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << '\n';
            return 2;
        }
    }

    mcplite::McpServer server{std::move(opts)};
    using mcplite::arg;

    server.add_tool("add", {"Add Numbers", "Add two numbers together",
                            "Add two numbers.\n"
                            "x: First number\n"
                            "y: Second number"},
        [](int x, int y) { return x + y; },
        {arg("x"), arg("y")});

    server.add_tool("list_operations", {"List Operations",
                                        "Perform operations on a list of numbers",
                                        "numbers: List of numbers to process\n"
                                        "operation: Operation to perform (sum, average, max, min)"},
        [](const std::vector<double>& numbers, const std::string& operation) -> double {
            if (numbers.empty()) return 0;
            double sum = std::accumulate(numbers.begin(), numbers.end(), 0.0);
            if (operation == "average") return sum / static_cast<double>(numbers.size());
            if (operation == "max") return *std::max_element(numbers.begin(), numbers.end());
            if (operation == "min") return *std::min_element(numbers.begin(), numbers.end());
            return sum;
        },
        {arg("numbers"), arg("operation").default_value("sum")});

    server.add_tool("divide", {"Divide", "Divide a by b", "a: Dividend\nb: Divisor"},
        [](double a, double b) {
            if (b == 0) throw std::domain_error("division by zero");
            return a / b;
        },
        {arg("a"), arg("b")});

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        std::cout << mcplite::Codec::serialize(server.handle_text(line)) << '\n' << std::flush;
    }
    return 0;
}

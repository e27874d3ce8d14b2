#include <arith/log.hpp>
#include <arith/repl.hpp>

#include <iostream>
#include <stdexcept>

int main() {
    arith::ReplConfig config;
    try {
        config = arith::ReplConfig::from_env();
    } catch (const std::invalid_argument& e) {
        std::cerr << "arith_repl: " << e.what() << "\n";
        return 2;
    }

    arith::Logger::instance().set_level(config.log_level);

    std::cout << "Enter an expression (or \"exit\" to quit).\n";
    arith::Repl repl(config);
    repl.run(std::cin, std::cout);
    return 0;
}

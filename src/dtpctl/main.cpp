// EN: dtpctl - Command line front end of the DT-Pipeline selection engine
// FR: dtpctl - Interface en ligne de commande du moteur de sélection DT-Pipeline

#include <iostream>
#include <string>
#include <vector>

#include "dtpctl/commands.hpp"
#include "infrastructure/logging/logger.hpp"

int main(int argc, char* argv[]) {
    // EN: stdout carries results only
    // FR: stdout ne transporte que les résultats
    auto& logger = DTP::Logger::getInstance();
    logger.setConsoleStream(std::cerr);
    logger.setLogLevel(DTP::LogLevel::WARN);

    std::vector<std::string> arguments(argv + 1, argv + argc);
    return DTP::Ctl::runDtpctl(arguments, std::cout, std::cerr);
}

#include <iostream>

#include <spdlog/spdlog.h>
#include <xfer/cli/xfer_cli.h>
#include <xfer/progress/progress_logger.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default until XferCli::run() has read the config and flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        xfer::cli::XferCli cli(std::cout, std::cerr, xfer::progress::stderrIsTty());
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

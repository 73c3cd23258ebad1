#include "cellscrub/CellScrub.hpp"
#include "cellscrub/app/ScrubOptions.hpp"
#include "cellscrub/app/ScrubSession.hpp"
#include "cellscrub/core/Path.hpp"
#include <iostream>

int main(int argc, char** argv)
{
    using namespace cellscrub;

    const std::string program = argc > 0 ? core::Path(argv[0]).filename() : "cellscrub-cli";

    auto parsed = app::ScrubOptionsParser::parse(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().message << "\n\n"
                  << app::ScrubOptionsParser::usage(program);
        return app::kExitUsage;
    }
    app::ScrubOptions options = std::move(parsed).value();

    if (options.show_help) {
        std::cout << app::ScrubOptionsParser::usage(program);
        return app::kExitOk;
    }

    if (!initialize(options.log_file, options.log_level, options.log_to_console)) {
        return app::kExitIoFailure;
    }

    int exit_code = app::kExitIoFailure;
    try {
        app::ScrubSession session(std::cin, std::cout);
        exit_code = session.run(options);
    } catch (const std::exception& e) {
        std::cout << "Error: " << e.what() << std::endl;
        CELLSCRUB_LOG_CRITICAL("Unhandled exception: {}", e.what());
        exit_code = app::kExitIoFailure;
    }

    cleanup();
    return exit_code;
}

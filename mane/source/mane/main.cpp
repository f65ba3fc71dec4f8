#include <mane/application.hpp>
#include <mane/arguments.hpp>
#include <log/log.hpp>

#include <unistd.h>

#include <filesystem>
#include <iostream>
#include <system_error>

int main(int argc, char** argv)
{
    Log::setupConsoleLogger(isatty(STDERR_FILENO) != 0);

    auto arguments = Mane::parseArguments(argc, argv);
    if (!arguments)
    {
        Log::error("{}", arguments.error().toString());
        std::cerr << Mane::usage();
        return Mane::exitUsage;
    }

    std::error_code ec;
    auto workingDirectory = std::filesystem::current_path(ec);
    if (ec)
    {
        Log::error("Could not determine the working directory: {}", ec.message());
        return Mane::exitFailure;
    }

    Mane::Application application{
        std::move(arguments).value(),
        Mane::Environment{
            .input = &std::cin,
            .output = &std::cout,
            .errorOutput = &std::cerr,
            .inputIsTerminal = isatty(STDIN_FILENO) != 0,
            .workingDirectory = std::move(workingDirectory),
        },
    };
    return application.run();
}

#include "CommandRunner.hpp"
#include "ConsoleUtils.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        filecrypt::ui::cli::disableCoreDumps();

        const std::vector<std::string> args(argv, argv + argc);
        filecrypt::ui::cli::CommandRunner runner{ std::cout, std::cerr, filecrypt::ui::cli::readPassword };
        return runner.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}

#include <iostream>
#include <string>
#include <vector>
#include "../healer/cli/cli.hpp"


int main(int argc, char* argv[])
{
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    std::vector<std::string> args(argv + 1, argv + argc);
    return healer::cli::runCli(args, std::cout, std::cerr);
}

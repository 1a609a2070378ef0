// Command-line front end to the project tracker: one action per invocation.

#include <iostream>
#include <string>
#include <vector>

#include "cli/Application.hpp"

using namespace trackr;

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    Application app(Application::httpClientFactory());
    return app.run(args, std::cout, std::cerr);
}

// src/app/main.cpp
#include "blockworld/app/BlockWorldApp.hpp"

#include <iostream>
#include <string_view>
#include <vector>

int main(int argc, char** argv)
{
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i)
        args.emplace_back(argv[i]);

    return blockworld::app::RunBlockWorld(args, std::cin, std::cout, std::cerr);
}

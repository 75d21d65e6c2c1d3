#include "SphereBVHApp.hpp"
#include <iostream>
#include <string>
#include <cstdlib>

static void printUsage(const char* exe)
{
    std::cerr << "usage: " << exe << " <scene.json> [outDir]\n"
        << "       " << exe << " --benchmark <outDir> <numSamples>\n";
}

int main(int argc, char** argv)
{
    try
    {
        if (argc >= 2 && std::string(argv[1]) == "--benchmark") {
            if (argc != 4) { printUsage(argv[0]); return EXIT_FAILURE; }
            SphereBVHApp app(argv[2], (uint32_t)std::stoul(argv[3]));
            app.run();
        }
        else if (argc == 2 || argc == 3) {
            SphereBVHApp app(argv[1], argc == 3 ? argv[2] : "bvh_out");
            app.run();
        }
        else {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }
    catch (const std::exception& err)
    {
        std::cerr << "Runtime error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

#include "modes.hpp"
#include "options.hpp"

#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - run     : convert a folder of TIFF rasters and build the animation.
    - convert : only write the PNG previews.
    - animate : only build the animation from a folder of PNG files.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  rasteranim-cli run     --input=DIR --output=DIR --gif=FILE [options]\n"
        << "  rasteranim-cli convert --input=DIR --output=DIR [options]\n"
        << "  rasteranim-cli animate --input=DIR --gif=FILE [options]\n";
    print_options();
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 2; }
    const std::string mode = argv[1];

    if      (mode == "run")     return run_full   (argc, argv);
    else if (mode == "convert") return run_convert(argc, argv);
    else if (mode == "animate") return run_animate(argc, argv);
    else if (mode == "help" || mode == "--help") { print_usage(); return 0; }

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 2;
}

/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

/**
 * @file main.cpp
 *
 * @brief Command-line front end: parses options and runs the reader.
 */

#include <getopt.h>

#include <iostream>
#include <string>

#include "ReaderOptions.hpp"

static void printHelp(const char *prog)
{
    std::cout << "Usage: " << prog << " [options] <file>\n";
    std::cout << "Options:\n";
    std::cout << "  --format <auto|spice|lef> Input format (default auto: "
                 ".lef/.tlef is LEF, else SPICE)\n";
    std::cout << "  --emit                    Print the netlist back as "
                 "SPICE\n";
    std::cout << "  --quiet                   Do not print the summary\n";
    std::cout << "  --help                    Show this help message\n";
}

int main(int argc, char *argv[])
{
    ReaderOptions options;

    static struct option long_options[] = {
        {"format", required_argument, 0, 'f'},
        {"emit", no_argument, 0, 'e'},
        {"quiet", no_argument, 0, 'q'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int option_index = 0;
    int c;
    while ((c = getopt_long(argc, argv, "f:eqh", long_options,
                            &option_index)) != -1) {
        if (c == 'h') {
            printHelp(argv[0]);
            return 0;
        } else if (c == 'f') {
            std::string format = optarg;
            if (format == "auto")
                options.format = InputFormat::Auto;
            else if (format == "spice")
                options.format = InputFormat::Spice;
            else if (format == "lef")
                options.format = InputFormat::Lef;
            else {
                std::cerr << "Invalid format '" << format
                          << "': expected auto, spice or lef" << std::endl;
                return 1;
            }
        } else if (c == 'e') {
            options.emit = true;
        } else if (c == 'q') {
            options.quiet = true;
        } else {
            printHelp(argv[0]);
            return 1;
        }
    }

    if (optind < argc)
        options.inputFile = argv[optind];

    try {
        options.validate();
    } catch (const std::exception &ex) {
        std::cerr << "Invalid option: " << ex.what() << std::endl;
        return 1;
    }

    return runReader(options);
}

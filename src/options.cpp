/*
 * src/options.cpp - Command line parsing
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "ahoview/options.h"
#include <cstring>
#include <stdexcept>
#include <getopt.h>

namespace ahoview {

InfoRequest find_info_request(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--") == 0) break;
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            return InfoRequest::HELP;
        }
        if (std::strcmp(arg, "-V") == 0 || std::strcmp(arg, "--version") == 0) {
            return InfoRequest::VERSION;
        }
    }
    return InfoRequest::NONE;
}

bool parse_command_line(int argc, char** argv, CommandLine& out) {
    out = CommandLine();

    int verbosity = 0;
    bool quiet = false;

    static struct option long_options[] = {
        {"mode", required_argument, nullptr, 'm'},
        {"preload", required_argument, nullptr, 'r'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"version", no_argument, nullptr, 'V'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    // Full reinitialisation so the parser can run more than once
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":m:r:vqVh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'm': {
                auto mode = rescale_mode_from_string(optarg);
                if (!mode) {
                    out.error = std::string("Unknown rescale mode '") + optarg + "'";
                    return false;
                }
                out.rescale_mode = *mode;
                break;
            }
            case 'r': {
                int radius = -1;
                try {
                    size_t used = 0;
                    radius = std::stoi(optarg, &used);
                    if (optarg[used] != '\0') radius = -1;
                } catch (const std::exception&) {
                    radius = -1;
                }
                if (radius < 0 || radius > MAX_PRELOAD_RADIUS) {
                    out.error = "Preload radius must be between 0 and " +
                                std::to_string(MAX_PRELOAD_RADIUS);
                    return false;
                }
                out.preload_radius = radius;
                break;
            }
            case 'v':
                verbosity++;
                break;
            case 'q':
                quiet = true;
                break;
            case 'V':
                out.info = InfoRequest::VERSION;
                break;
            case 'h':
                out.info = InfoRequest::HELP;
                break;
            case ':':
                out.error = "Missing argument for option";
                return false;
            default:
                out.error = "Unknown option";
                return false;
        }
    }

    if (quiet) {
        out.log_level = LogLevel::QUIET;
    } else if (verbosity == 1) {
        out.log_level = LogLevel::VERBOSE;
    } else if (verbosity > 1) {
        out.log_level = LogLevel::DEBUG;
    }

    if (argc - optind > 1) {
        out.error = "Only one PATH may be given";
        return false;
    }
    if (optind < argc) {
        out.path = argv[optind];
    }
    return true;
}

void print_usage(std::ostream& os, const char* program) {
    os << "Usage: " << program << " [OPTIONS] [PATH]\n\n";
    os << "Browse the images of a directory. PATH may be a directory or an image file.\n\n";
    os << "Options:\n";
    os << "  -m, --mode MODE      Rescale mode: fit, original, stretch, height, width\n";
    os << "  -r, --preload N      Keep N pictures on each side decoded (0-"
       << MAX_PRELOAD_RADIUS << ", default: " << DEFAULT_PRELOAD_RADIUS << ")\n";
    os << "  -v, --verbose        More log output (repeat for debug)\n";
    os << "  -q, --quiet          Log errors only\n";
    os << "  -V, --version        Show version\n";
    os << "  -h, --help           Show this help message\n";
    os << "\nExamples:\n";
    os << "  " << program << " ~/Pictures\n";
    os << "  " << program << " -m width -r 2 scans/\n";
}

} // namespace ahoview

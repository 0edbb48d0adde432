// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of Micron.
//
// Micron is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Micron is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Micron.
// If not, see <https://www.gnu.org/licenses/>.

#ifndef MICRON_SERVER_SERVER_MAIN_HPP
#define MICRON_SERVER_SERVER_MAIN_HPP

#include "micron/Machine.hpp"
#include "micron/service/Server.hpp"
#include "micron/server/ImageSpec.hpp"

#include <chrono>
#include <csignal>
#include <atomic>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace micron::server {

namespace {

constexpr uint16_t DEFAULT_GRPC_PORT = 0xC0DE;  // 49374

std::atomic<bool> g_running{true};

void signal_handler(int /*signal*/) {
    g_running = false;
}

std::vector<uint8_t> load_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(size);
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw std::runtime_error("Cannot read file: " + filepath.string());
    }

    return data;
}

// Load an image file into the named device of the machine's memory map
void load_image(Machine& machine, const ImageResolver& resolver, const ImageSpec& spec) {
    const Device* device = machine.memory().find(spec.device);
    if (!device) {
        throw std::runtime_error("No device named " + spec.device);
    }

    auto filepath = resolver.resolve(spec.filepath);
    std::cout << "Loading " << spec.device << " image: " << filepath << "\n";
    auto data = load_file(filepath);

    const uint32_t capacity = size_of(*device);
    if (data.size() < capacity) {
        std::cerr << "Warning: " << spec.device << " image is " << data.size()
                  << " bytes, zero-padding to " << capacity << "\n";
    }

    MemoryError error = machine.memory().load(spec.device, data);
    if (error != MemoryError::None) {
        throw std::runtime_error(
            spec.device + " image of " + std::to_string(data.size()) +
            " bytes rejected (" + std::string(to_string(error)) + "), capacity is " +
            std::to_string(capacity) + " bytes");
    }
}

} // anonymous namespace

inline void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options]\n"
              << "\n"
              << "Optional:\n"
              << "  --rom <filepath>         ROM image for $" << std::hex << std::uppercase
              << kRomStart << "-$" << (kRomStart + kRomSize - 1) << "\n"
              << "  --ram <filepath>         Initial RAM image for $" << std::setw(4) << std::setfill('0')
              << kRamStart << "-$" << (kRamStart + kRamSize - 1) << std::dec << std::nouppercase << std::setfill(' ') << "\n"
              << "  --image <name>=<filepath> Image for any named device (repeatable)\n"
              << "  --image-dir <dirpath>    Directory searched for relative image paths\n"
              << "                           (default: $MICRON_IMAGE_DIR, then the working directory)\n"
              << "  --address <host>         gRPC listen address (default: 0.0.0.0)\n"
              << "  --port <port>            gRPC port (default: " << DEFAULT_GRPC_PORT << ")\n"
              << "  --map                    Print the memory map and exit\n"
              << "  --info                   Show machine information and exit\n"
              << "  --help                   Show this help message\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --rom monitor.rom        # Serve with a ROM image\n"
              << "  " << program_name << " --image IO=io.bin        # Preload the IO window\n"
              << "  " << program_name << " --map                    # Inspect the memory map\n";
}

inline void print_info(const char* program_name, const Machine& machine) {
    // JSON output for machine discovery
    std::cout << "{\n"
              << "  \"executable\": \"" << program_name << "\",\n"
              << "  \"version\": \"" << MICRON_VERSION << "\",\n"
              << "  \"regions\": [\n";

    auto regions = machine.memory().regions();
    for (size_t i = 0; i < regions.size(); ++i) {
        const auto& region = regions[i];
        std::cout << "    {\"name\": \"" << region.name << "\", "
                  << "\"type\": \"" << to_string(region.kind) << "\", "
                  << "\"base_address\": " << region.base_address << ", "
                  << "\"size\": " << region.size << "}"
                  << (i + 1 < regions.size() ? "," : "") << "\n";
    }

    std::cout << "  ]\n"
              << "}\n";
}

inline int server_main(int argc, char* argv[]) {
    std::vector<ImageSpec> images;
    std::string image_dirpath;
    std::string listen_address = "0.0.0.0";
    uint16_t port = DEFAULT_GRPC_PORT;
    bool print_map_only = false;
    bool print_info_only = false;

    // Parse arguments
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--info") {
                print_info_only = true;
            } else if (arg == "--map") {
                print_map_only = true;
            } else if (arg == "--rom" && i + 1 < argc) {
                images.push_back({std::string(kRomName), argv[++i]});
            } else if (arg == "--ram" && i + 1 < argc) {
                images.push_back({std::string(kRamName), argv[++i]});
            } else if (arg == "--image" && i + 1 < argc) {
                images.push_back(parse_image_spec(argv[++i]));
            } else if (arg == "--image-dir" && i + 1 < argc) {
                image_dirpath = argv[++i];
            } else if (arg == "--address" && i + 1 < argc) {
                listen_address = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                int value = std::stoi(argv[++i]);
                if (value <= 0 || value > 65535) {
                    throw std::runtime_error("Invalid port: " + std::to_string(value));
                }
                port = static_cast<uint16_t>(value);
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // Set up signal handler
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        Machine machine;

        if (print_info_only) {
            print_info(argv[0], machine);
            return 0;
        }

        // Images load in command-line order, so a later image for the
        // same device replaces an earlier one
        const auto resolver = ImageResolver::from_environment(image_dirpath);
        for (const auto& spec : images) {
            load_image(machine, resolver, spec);
        }

        machine.warm_reset();

        machine.memory().print_table(std::cout);

        if (print_map_only) {
            return 0;
        }

        // Start gRPC server
        std::cout << "Starting gRPC server on " << listen_address << ":" << port << "...\n";
        micron::service::Server server(machine, listen_address, port);
        server.start();

        std::cout << "micron-server running. Press Ctrl+C to stop.\n";

        // Memory traffic is driven entirely by gRPC clients
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << "\nShutting down...\n";
        server.stop();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

} // namespace micron::server

#endif // MICRON_SERVER_SERVER_MAIN_HPP

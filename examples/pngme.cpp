/**
 * @file pngme.cpp
 * @brief Hide text messages in PNG files
 *
 * This example shows how to add, read, remove and list chunks of a PNG
 * file. Messages are stored in chunks of a caller-chosen type, which
 * should normally be ancillary, private and safe to copy (e.g. "ruSt").
 *
 * Usage:
 *   pngme encode <file> <type> <message> [output]
 *   pngme decode <file> <type>
 *   pngme remove <file> <type>
 *   pngme print <file>
 */

#include <pngchunk/png_file.hh>
#include <pngchunk/parse_options.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>

class MessageTool {
public:
    explicit MessageTool(bool verbose) {
        // Warnings only appear with --verbose
        if (verbose) {
            options_.on_warning = [](std::uint64_t offset, std::string_view category,
                                     std::string_view message) {
                std::cerr << "Warning [" << category << "] at offset " << offset
                          << ": " << message << "\n";
            };
        }
    }

    void encode(const std::string& filename, const std::string& type,
                const std::string& message, const std::string& output) {
        auto png = load(filename);
        pngchunk::chunk_type tag(type);
        if (!tag.is_valid()) {
            std::cerr << "Warning: '" << type << "' has the reserved bit set\n";
        }

        png.append(pngchunk::chunk(tag, message));

        // Keep IEND last so decoders still accept the file
        if (auto* end = png.find(pngchunk::chunk_types::IEND)) {
            if (&png.chunks().back() != end) {
                png.append(png.remove_first(pngchunk::chunk_types::IEND));
            }
        }

        save(png, output.empty() ? filename : output);
        std::cout << "Encoded " << message.size() << " bytes into '" << type << "' chunk\n";
    }

    void decode(const std::string& filename, const std::string& type) {
        auto png = load(filename);
        const auto* found = png.find(pngchunk::chunk_type(type));
        if (!found) {
            std::cout << "No '" << type << "' chunk in " << filename << "\n";
            return;
        }
        std::cout << found->data_as_string() << "\n";
    }

    void remove(const std::string& filename, const std::string& type) {
        auto png = load(filename);
        auto removed = png.remove_first(pngchunk::chunk_type(type));
        save(png, filename);
        std::cout << "Removed " << removed << "\n";
    }

    void print(const std::string& filename) {
        auto png = load(filename);
        std::cout << filename << ": " << png.chunks().size() << " chunk(s)\n";
        std::cout << "=========================================\n";
        for (const auto& c : png.chunks()) {
            const auto& t = c.type();
            std::cout << c
                      << (t.is_critical() ? " critical" : " ancillary")
                      << (t.is_public() ? " public" : " private")
                      << (t.is_safe_to_copy() ? " safe-to-copy" : "")
                      << "\n";
        }
    }

private:
    pngchunk::png_file load(const std::string& filename) const {
        std::ifstream file(filename, std::ios::binary);
        THROW_IO_UNLESS(file, "Failed to open file: ", filename);
        return pngchunk::png_file::from_stream(file, options_);
    }

    static void save(const pngchunk::png_file& png, const std::string& filename) {
        std::ofstream file(filename, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Failed to create file: ", filename);
        png.write_to(file);
    }

    pngchunk::parse_options options_;
};

static void usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " [--verbose] encode <file> <type> <message> [output]\n"
              << "  " << prog << " [--verbose] decode <file> <type>\n"
              << "  " << prog << " [--verbose] remove <file> <type>\n"
              << "  " << prog << " [--verbose] print <file>\n";
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    bool verbose = false;
    if (!args.empty() && args.front() == "--verbose") {
        verbose = true;
        args.erase(args.begin());
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    MessageTool tool(verbose);
    const auto& command = args[0];

    try {
        if (command == "encode" && (args.size() == 4 || args.size() == 5)) {
            tool.encode(args[1], args[2], args[3], args.size() == 5 ? args[4] : std::string());
        } else if (command == "decode" && args.size() == 3) {
            tool.decode(args[1], args[2]);
        } else if (command == "remove" && args.size() == 3) {
            tool.remove(args[1], args[2]);
        } else if (command == "print" && args.size() == 2) {
            tool.print(args[1]);
        } else {
            usage(argv[0]);
            return 1;
        }
    } catch (const pngchunk::parse_error& e) {
        std::cerr << "Error (" << pngchunk::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

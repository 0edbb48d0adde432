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


#ifndef MICRON_SERVER_IMAGE_SPEC_HPP
#define MICRON_SERVER_IMAGE_SPEC_HPP

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace micron::server {

// An image to load at startup: the registered device that receives it and
// the file holding its bytes.
struct ImageSpec {
    std::string device;
    std::filesystem::path filepath;
};

// Parse a command-line image argument of the form NAME=path.
// Throws std::invalid_argument if either side of the '=' is empty.
inline ImageSpec parse_image_spec(std::string_view arg) {
    const auto separator = arg.find('=');
    if (separator == std::string_view::npos || separator == 0 || separator + 1 == arg.size()) {
        throw std::invalid_argument(
            "Image must be given as NAME=path, got: " + std::string(arg));
    }
    return ImageSpec{std::string(arg.substr(0, separator)),
                     std::filesystem::path(arg.substr(separator + 1))};
}

// Locates image files named on the command line.
//
// Absolute paths are used as-is. A relative path is tried in the image
// directory first, when one is configured, and then against the working
// directory.
class ImageResolver {
public:
    ImageResolver() = default;

    explicit ImageResolver(std::filesystem::path image_dirpath)
        : image_dirpath_(std::move(image_dirpath)) {
        if (!std::filesystem::is_directory(*image_dirpath_)) {
            throw std::runtime_error(
                "Image directory does not exist: " + image_dirpath_->string());
        }
    }

    // An explicit directory wins; otherwise MICRON_IMAGE_DIR if it names a
    // directory; otherwise no image directory.
    static ImageResolver from_environment(const std::string& explicit_dirpath) {
        if (!explicit_dirpath.empty()) {
            return ImageResolver(explicit_dirpath);
        }
        if (const char* env_dir = std::getenv("MICRON_IMAGE_DIR")) {
            if (std::filesystem::is_directory(env_dir)) {
                return ImageResolver(env_dir);
            }
        }
        return ImageResolver();
    }

    const std::optional<std::filesystem::path>& image_directory() const {
        return image_dirpath_;
    }

    std::filesystem::path resolve(const std::filesystem::path& filepath) const {
        if (filepath.is_absolute()) {
            if (!std::filesystem::is_regular_file(filepath)) {
                throw std::runtime_error("Image file not found: " + filepath.string());
            }
            return filepath;
        }

        if (image_dirpath_) {
            auto candidate = *image_dirpath_ / filepath;
            if (std::filesystem::is_regular_file(candidate)) {
                return candidate;
            }
        }

        auto candidate = std::filesystem::current_path() / filepath;
        if (std::filesystem::is_regular_file(candidate)) {
            return candidate;
        }

        std::string message = "Image file not found: " + filepath.string();
        if (image_dirpath_) {
            message += " (searched " + image_dirpath_->string() + " and the working directory)";
        }
        throw std::runtime_error(message);
    }

private:
    std::optional<std::filesystem::path> image_dirpath_;
};

} // namespace micron::server

#endif // MICRON_SERVER_IMAGE_SPEC_HPP

#include <catch2/catch_test_macros.hpp>
#include <micron/server/ImageSpec.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using micron::server::ImageResolver;
using micron::server::ImageSpec;
using micron::server::parse_image_spec;

namespace {

// Scratch directory holding one image file, removed on destruction
class ScratchDirectory {
public:
    ScratchDirectory()
        : dirpath_(std::filesystem::temp_directory_path() / "micron_test_image_spec") {
        std::filesystem::create_directories(dirpath_);
        std::ofstream(dirpath_ / "monitor.rom", std::ios::binary) << "\xA9\x01\x60";
    }

    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(dirpath_, ec);
    }

    const std::filesystem::path& path() const { return dirpath_; }

private:
    std::filesystem::path dirpath_;
};

// Change the working directory for the lifetime of the object
class WorkingDirectory {
public:
    explicit WorkingDirectory(const std::filesystem::path& dirpath)
        : previous_(std::filesystem::current_path()) {
        std::filesystem::current_path(dirpath);
    }

    ~WorkingDirectory() {
        std::error_code ec;
        std::filesystem::current_path(previous_, ec);
    }

private:
    std::filesystem::path previous_;
};

} // anonymous namespace

TEST_CASE("Image spec parsing", "[image_spec]") {
    SECTION("Name and path") {
        ImageSpec spec = parse_image_spec("IO=io.bin");
        REQUIRE(spec.device == "IO");
        REQUIRE(spec.filepath == std::filesystem::path("io.bin"));
    }

    SECTION("Only the first '=' separates") {
        ImageSpec spec = parse_image_spec("RAM=dumps/a=b.bin");
        REQUIRE(spec.device == "RAM");
        REQUIRE(spec.filepath == std::filesystem::path("dumps/a=b.bin"));
    }

    SECTION("Malformed arguments are rejected") {
        REQUIRE_THROWS_AS(parse_image_spec("monitor.rom"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_image_spec("=monitor.rom"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_image_spec("ROM="), std::invalid_argument);
    }
}

TEST_CASE("Image resolution with an image directory", "[image_spec]") {
    ScratchDirectory scratch;
    ImageResolver resolver(scratch.path());

    REQUIRE(resolver.image_directory() == scratch.path());

    SECTION("Relative file is found in the image directory") {
        REQUIRE(resolver.resolve("monitor.rom") == scratch.path() / "monitor.rom");
    }

    SECTION("Absolute path is returned as-is") {
        auto absolute = scratch.path() / "monitor.rom";
        REQUIRE(resolver.resolve(absolute) == absolute);
    }

    SECTION("Missing file is reported") {
        REQUIRE_THROWS_AS(resolver.resolve("missing.rom"), std::runtime_error);
    }
}

TEST_CASE("Image resolution falls back to the working directory", "[image_spec]") {
    ScratchDirectory scratch;
    WorkingDirectory cwd(scratch.path());

    ImageResolver resolver;
    REQUIRE_FALSE(resolver.image_directory().has_value());
    REQUIRE(std::filesystem::equivalent(resolver.resolve("monitor.rom"),
                                        scratch.path() / "monitor.rom"));
    REQUIRE_THROWS_AS(resolver.resolve("missing.rom"), std::runtime_error);
}

TEST_CASE("Image resolver rejects a nonexistent directory", "[image_spec]") {
    REQUIRE_THROWS_AS(ImageResolver("/nonexistent/micron/images"), std::runtime_error);
    REQUIRE_THROWS_AS(ImageResolver::from_environment("/nonexistent/micron/images"),
                      std::runtime_error);
}

TEST_CASE("Image resolver missing absolute file", "[image_spec]") {
    ImageResolver resolver;
    REQUIRE_THROWS_AS(resolver.resolve("/nonexistent/micron/monitor.rom"), std::runtime_error);
}

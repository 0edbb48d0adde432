#include <catch2/catch_test_macros.hpp>
#include <micron/devices/Device.hpp>
#include <micron/devices/Mmio.hpp>
#include <micron/devices/Ram.hpp>
#include <micron/devices/Rom.hpp>

#include <array>
#include <stdexcept>
#include <vector>

using namespace micron;

TEST_CASE("Ram device", "[devices][ram]") {
    Ram ram(256, 0x1000);

    SECTION("Initialized to zero") {
        for (uint16_t addr = 0x1000; addr < 0x1100; ++addr) {
            auto result = ram.read(addr);
            REQUIRE(result.ok());
            REQUIRE(result.value == 0);
        }
    }

    SECTION("Write and read back") {
        REQUIRE(ram.write(0x1042, 0xAB) == MemoryError::None);
        REQUIRE(ram.read(0x1042).value == 0xAB);
    }

    SECTION("Read is bounded by the device range") {
        REQUIRE(ram.read(0x0FFF).error == MemoryError::OutOfBounds);
        REQUIRE(ram.read(0x1000).ok());
        REQUIRE(ram.read(0x10FF).ok());
        REQUIRE(ram.read(0x1100).error == MemoryError::OutOfBounds);
    }

    SECTION("Out of range write is reported and stores nothing") {
        REQUIRE(ram.write(0x1100, 0x11) == MemoryError::OutOfBounds);
        REQUIRE(ram.write(0x0000, 0x11) == MemoryError::OutOfBounds);
        for (uint8_t byte : ram.data()) {
            REQUIRE(byte == 0);
        }
    }

    SECTION("Type tag") {
        REQUIRE(ram.type_of() == DeviceKind::Ram);
    }
}

TEST_CASE("Ram constructed from image", "[devices][ram]") {
    const std::array<uint8_t, 4> image = {0x12, 0x34, 0x56, 0x78};
    Ram ram(image, 4, 0x1000);

    REQUIRE(ram.read(0x1000).value == 0x12);
    REQUIRE(ram.read(0x1001).value == 0x34);
    REQUIRE(ram.read(0x1002).value == 0x56);
    REQUIRE(ram.read(0x1003).value == 0x78);
    REQUIRE(ram.read(0x1004).error == MemoryError::OutOfBounds);

    REQUIRE(ram.write(0x1000, 0x11) == MemoryError::None);
    REQUIRE(ram.read(0x1000).value == 0x11);
}

TEST_CASE("Rom device", "[devices][rom]") {
    const std::array<uint8_t, 4> image = {0x12, 0x34, 0x56, 0x78};
    Rom rom(image, 4, 0x1000);

    SECTION("Reads the image in order") {
        REQUIRE(rom.read(0x1000).value == 0x12);
        REQUIRE(rom.read(0x1001).value == 0x34);
        REQUIRE(rom.read(0x1002).value == 0x56);
        REQUIRE(rom.read(0x1003).value == 0x78);
    }

    SECTION("Read past the end is out of bounds") {
        auto result = rom.read(0x1004);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error == MemoryError::OutOfBounds);
    }

    SECTION("Writes are ignored") {
        REQUIRE(rom.write(0x1000, 0xAB) == MemoryError::None);
        REQUIRE(rom.read(0x1000).value == 0x12);
    }

    SECTION("Out of range writes are ignored without error") {
        REQUIRE(rom.write(0x1004, 0xAB) == MemoryError::None);
        REQUIRE(rom.write(0xFFFF, 0xAB) == MemoryError::None);
        REQUIRE(rom.data()[0] == 0x12);
        REQUIRE(rom.data()[3] == 0x78);
    }

    SECTION("Type tag") {
        REQUIRE(rom.type_of() == DeviceKind::Rom);
    }
}

TEST_CASE("Device load", "[devices][load]") {
    Rom rom(std::array<uint8_t, 4>{0x12, 0x34, 0x56, 0x78}, 4, 0x1000);

    SECTION("Full image replaces contents") {
        const std::array<uint8_t, 4> data = {0x11, 0x22, 0x33, 0x44};
        REQUIRE(rom.load(data) == MemoryError::None);
        REQUIRE(rom.read(0x1000).value == 0x11);
        REQUIRE(rom.read(0x1001).value == 0x22);
        REQUIRE(rom.read(0x1002).value == 0x33);
        REQUIRE(rom.read(0x1003).value == 0x44);

        // Write still ignored after load
        REQUIRE(rom.write(0x1000, 0xFF) == MemoryError::None);
        REQUIRE(rom.read(0x1000).value == 0x11);
    }

    SECTION("Short image is zero-padded") {
        const std::array<uint8_t, 2> data = {0x11, 0x22};
        REQUIRE(rom.load(data) == MemoryError::None);
        REQUIRE(rom.size() == 4);
        REQUIRE(rom.read(0x1000).value == 0x11);
        REQUIRE(rom.read(0x1001).value == 0x22);
        REQUIRE(rom.read(0x1002).value == 0x00);
        REQUIRE(rom.read(0x1003).value == 0x00);
    }

    SECTION("Oversized image is rejected and storage untouched") {
        const std::array<uint8_t, 5> data = {0x11, 0x22, 0x33, 0x44, 0x55};
        REQUIRE(rom.load(data) == MemoryError::OutOfBounds);
        REQUIRE(rom.read(0x1000).value == 0x12);
        REQUIRE(rom.read(0x1003).value == 0x78);
    }

    SECTION("Empty image clears the device") {
        REQUIRE(rom.load(std::span<const uint8_t>{}) == MemoryError::None);
        for (uint8_t byte : rom.data()) {
            REQUIRE(byte == 0);
        }
    }
}

TEST_CASE("Ram load replaces rather than appends", "[devices][load]") {
    Ram ram(8, 0x0000);
    for (uint16_t addr = 0; addr < 8; ++addr) {
        REQUIRE(ram.write(addr, 0xEE) == MemoryError::None);
    }

    const std::array<uint8_t, 3> data = {0x01, 0x02, 0x03};
    REQUIRE(ram.load(data) == MemoryError::None);

    REQUIRE(ram.read(0x0000).value == 0x01);
    REQUIRE(ram.read(0x0002).value == 0x03);
    for (uint16_t addr = 3; addr < 8; ++addr) {
        REQUIRE(ram.read(addr).value == 0x00);
    }
    REQUIRE(ram.data().size() == 8);
}

TEST_CASE("Oversized construction image throws", "[devices]") {
    const std::vector<uint8_t> image(5, 0xAA);
    REQUIRE_THROWS_AS(Ram(image, 4, 0x0000), std::length_error);
    REQUIRE_THROWS_AS(Rom(image, 4, 0x0000), std::length_error);
}

TEST_CASE("Building a device from an image", "[devices][variant]") {
    SECTION("Image fits and is zero-padded") {
        const std::array<uint8_t, 2> image = {0xA9, 0x01};
        DeviceResult result = make_device(DeviceKind::Rom, image, 4, 0x8000);
        REQUIRE(result.ok());
        REQUIRE(result.device.has_value());
        REQUIRE(kind_of(*result.device) == DeviceKind::Rom);
        REQUIRE(base_offset_of(*result.device) == 0x8000);
        REQUIRE(read_device(*result.device, 0x8001).value == 0x01);
        REQUIRE(read_device(*result.device, 0x8003).value == 0x00);
    }

    SECTION("Oversized image is reported, not thrown") {
        const std::vector<uint8_t> image(5, 0xAA);
        for (auto kind : {DeviceKind::Ram, DeviceKind::Rom, DeviceKind::Mmio}) {
            DeviceResult result = make_device(kind, image, 4, 0x0000);
            REQUIRE(result.error == MemoryError::OutOfBounds);
            REQUIRE_FALSE(result.device.has_value());
        }
    }
}

TEST_CASE("Device at the top of the address space", "[devices]") {
    Ram ram(0x100, 0xFF00);

    REQUIRE(ram.write(0xFFFF, 0x5A) == MemoryError::None);
    REQUIRE(ram.read(0xFFFF).value == 0x5A);
    REQUIRE(ram.read(0xFEFF).error == MemoryError::OutOfBounds);
}

TEST_CASE("Indexed access", "[devices][index]") {
    const std::array<uint8_t, 4> image = {0x12, 0x34, 0x56, 0x78};

    SECTION("Rom index reads") {
        const Rom rom(image, 4, 0x1000);
        REQUIRE(rom[0x1000] == 0x12);
        REQUIRE(rom[0x1001] == 0x34);
        REQUIRE(rom[0x1002] == 0x56);
        REQUIRE(rom[0x1003] == 0x78);
    }

    SECTION("Ram index reads and writes") {
        Ram ram(image, 4, 0x1000);
        REQUIRE(ram[0x1003] == 0x78);

        ram[0x1000] = 0x11;
        REQUIRE(ram[0x1000] == 0x11);
        REQUIRE(ram.read(0x1000).value == 0x11);

        uint8_t& value = ram[0x1001];
        value = 0x22;
        REQUIRE(ram.read(0x1001).value == 0x22);
    }
}

TEST_CASE("Mmio device", "[devices][mmio]") {
    Mmio io(0x10, 0x4000);

    REQUIRE(io.type_of() == DeviceKind::Mmio);
    REQUIRE(io.write(0x400F, 0x99) == MemoryError::None);
    REQUIRE(io.read(0x400F).value == 0x99);
    REQUIRE(io.write(0x4010, 0x99) == MemoryError::OutOfBounds);
}

TEST_CASE("MemoryDevice concept", "[devices][concepts]") {
    STATIC_REQUIRE(MemoryDevice<Ram>);
    STATIC_REQUIRE(MemoryDevice<Rom>);
    STATIC_REQUIRE(MemoryDevice<Mmio>);
}

TEST_CASE("Device variant", "[devices][variant]") {
    SECTION("make_device builds each kind zero-filled") {
        for (auto kind : {DeviceKind::Ram, DeviceKind::Rom, DeviceKind::Mmio}) {
            Device device = make_device(kind, 0x100, 0x2000);
            REQUIRE(kind_of(device) == kind);
            REQUIRE(size_of(device) == 0x100);
            REQUIRE(base_offset_of(device) == 0x2000);
            REQUIRE(read_device(device, 0x2080).value == 0);
        }
    }

    SECTION("Dispatch follows the held alternative") {
        Device ram = make_device(DeviceKind::Ram, 0x100, 0x0000);
        Device rom = make_device(DeviceKind::Rom, 0x100, 0x0000);

        REQUIRE(write_device(ram, 0x0010, 0x42) == MemoryError::None);
        REQUIRE(write_device(rom, 0x0010, 0x42) == MemoryError::None);

        REQUIRE(read_device(ram, 0x0010).value == 0x42);
        REQUIRE(read_device(rom, 0x0010).value == 0x00);
    }

    SECTION("Load through the variant") {
        Device device = make_device(DeviceKind::Rom, 2, 0x8000);
        const std::array<uint8_t, 2> data = {0xA9, 0x00};
        REQUIRE(load_device(device, data) == MemoryError::None);
        REQUIRE(data_of(device)[0] == 0xA9);

        const std::array<uint8_t, 3> too_big = {0x01, 0x02, 0x03};
        REQUIRE(load_device(device, too_big) == MemoryError::OutOfBounds);
        REQUIRE(data_of(device)[0] == 0xA9);
    }
}

TEST_CASE("Error and kind names", "[devices]") {
    REQUIRE(to_string(DeviceKind::Ram) == "RAM");
    REQUIRE(to_string(DeviceKind::Rom) == "ROM");
    REQUIRE(to_string(DeviceKind::Mmio) == "MMIO");
    REQUIRE(to_string(MemoryError::OutOfBounds) == "out of bounds");
    REQUIRE(to_string(MemoryError::Unmapped) == "unmapped");
    REQUIRE(to_string(MemoryMapError::Overlap) == "overlap");
}

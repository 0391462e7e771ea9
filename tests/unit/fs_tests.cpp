/**
 * Unit tests for salvage::fs file helpers
 */

#include <salvage/fs.hpp>
#include <doctest/doctest.h>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace {

class TempTestDir {
public:
    TempTestDir() {
        std::string temp_base = std::filesystem::temp_directory_path().string();
        std::srand(static_cast<unsigned>(std::time(nullptr)));
        std::string unique_name = "salvage_fs_" + std::to_string(std::time(nullptr)) + "_" +
                                  std::to_string(std::rand());
        path = temp_base + "/" + unique_name;
        std::filesystem::create_directories(path);
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    }

    std::string path;
};

} // namespace

TEST_CASE("salvage::fs::write_file creates parent directories") {
    TempTestDir temp_dir;
    std::string file_path = temp_dir.path + "/src/components/Button.tsx";

    REQUIRE(salvage::fs::write_file(file_path, "export const Button = 1;"));
    CHECK(salvage::fs::exists(temp_dir.path + "/src/components"));

    auto content = salvage::fs::read_file(file_path);
    REQUIRE(content.has_value());
    CHECK(*content == "export const Button = 1;");
}

TEST_CASE("salvage::fs::read_file") {
    TempTestDir temp_dir;

    SUBCASE("binary content survives") {
        std::string file_path = temp_dir.path + "/crlf.txt";
        std::ofstream(file_path, std::ios::binary) << "a\r\nb";
        auto content = salvage::fs::read_file(file_path);
        REQUIRE(content.has_value());
        CHECK(*content == "a\r\nb");
    }

    SUBCASE("missing file") {
        CHECK_FALSE(salvage::fs::read_file(temp_dir.path + "/missing.txt").has_value());
        CHECK_FALSE(salvage::fs::read_input(temp_dir.path + "/missing.txt").has_value());
    }
}

TEST_CASE("salvage::fs::create_directories") {
    TempTestDir temp_dir;
    std::string nested = temp_dir.path + "/a/b/c";
    CHECK(salvage::fs::create_directories(nested));
    CHECK(salvage::fs::exists(nested));
    CHECK(salvage::fs::create_directories(nested));
}

#include "chronoslots/InputFile.hpp"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <string>

namespace chronoslots {

TEST_CASE("InputFile read") {
    SUBCASE("missing file") {
        InputFile inputFile("/nonexistent/chronoslots/schedule.json");
        CHECK(!inputFile.read());
    }
    SUBCASE("whole file") {
        auto path = std::filesystem::temp_directory_path() / "chronoslots_input_file_test.json";
        std::string contents("{\"events\": []}\n");
        {
            std::ofstream outFile(path, std::ofstream::binary | std::ofstream::trunc);
            outFile << contents;
        }
        InputFile inputFile(path.string());
        REQUIRE(inputFile.read());
        CHECK(inputFile.contents() == contents);
        CHECK(inputFile.path() == path.string());
        std::filesystem::remove(path);
    }
}

} // namespace chronoslots

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "test_helpers/thumbgrid_test_support.h"

#include <catch2/catch_all.hpp>

#include <filesystem>
#include <fstream>

namespace thumbgrid {

// Test fixture for Config class testing
class ConfigTestFixture {
  protected:
    Config config;
    test::TempDir dir;

    std::string config_path() const {
        return dir.path() + "/thumbgrid.json";
    }

    void write_file(const std::string& contents) {
        std::ofstream out(config_path());
        out << contents;
    }

    json read_file() {
        std::ifstream in(config_path());
        return json::parse(in);
    }

    void set_data(const json& j) {
        config.data = j;
    }
};

} // namespace thumbgrid

using namespace thumbgrid;

// ============================================================================
// get()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing values", "[config][get]") {
    set_data({{"grid", {{"card_width", 260}}}, {"log_level", "debug"}});

    REQUIRE(config.get<int>("/grid/card_width") == 260);
    REQUIRE(config.get<std::string>("/log_level") == "debug");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() without default throws on missing path",
                 "[config][get]") {
    set_data({{"grid", {{"card_width", 260}}}});
    REQUIRE_THROWS_AS(config.get<int>("/grid/missing"), json::exception);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default", "[config][get]") {
    set_data({{"grid", {{"card_width", "wide"}}}});

    SECTION("missing path returns the default") {
        REQUIRE(config.get<int>("/grid/overscan_rows", 2) == 2);
    }

    SECTION("wrong type returns the default") {
        REQUIRE(config.get<int>("/grid/card_width", 230) == 230);
    }
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate paths", "[config][set]") {
    set_data(json::object());
    config.set<int>("/grid/card_width", 300);
    REQUIRE(config.get<int>("/grid/card_width") == 300);
}

// ============================================================================
// init() / save()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() creates a default file", "[config][init]") {
    config.init(config_path());

    REQUIRE(std::filesystem::exists(config_path()));
    REQUIRE(read_file() == Config::get_default_config());
    REQUIRE(config.get<int>("/cache/memory_capacity") == 350);
    REQUIRE(config.get<int>("/grid/scroll_idle_ms") == 540);
    REQUIRE(config.get_path() == config_path());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() keeps user values and fills missing keys",
                 "[config][init]") {
    write_file(R"({"cache": {"memory_capacity": 10}, "extra": true})");
    config.init(config_path());

    REQUIRE(config.get<int>("/cache/memory_capacity") == 10);
    REQUIRE(config.get<bool>("/cache/disk_enabled") == true);
    REQUIRE(config.get<int>("/grid/card_width") == 230);
    REQUIRE(config.get<bool>("/extra") == true);

    json saved = read_file();
    REQUIRE(saved["cache"]["memory_capacity"] == 10);
    REQUIRE(saved["grid"]["card_width"] == 230);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: corrupt file is backed up and replaced",
                 "[config][init]") {
    SECTION("invalid JSON") {
        write_file("{ this is not json");
    }
    SECTION("root is not an object") {
        write_file("[1, 2, 3]");
    }

    config.init(config_path());

    REQUIRE(std::filesystem::exists(config_path() + ".corrupt"));
    REQUIRE(read_file() == Config::get_default_config());
    REQUIRE(config.get<int>("/thumbnails/target_size") == 200);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() round-trips changes", "[config][save]") {
    config.init(config_path());
    config.set<int>("/grid/card_width", 320);
    REQUIRE(config.save());

    Config reloaded;
    reloaded.init(config_path());
    REQUIRE(reloaded.get<int>("/grid/card_width") == 320);
    REQUIRE_FALSE(std::filesystem::exists(config_path() + ".tmp"));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() without a path fails", "[config][save]") {
    set_data(Config::get_default_config());
    REQUIRE_FALSE(config.save());
}

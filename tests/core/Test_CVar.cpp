#include <doctest/doctest.h>
#include "kine/core/cvar.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace kine::core;

TEST_CASE("CVar registration and parsing") {
    CVar<float> blend("test_blend_bias", "Test float", 0.25f);
    CVar<int> layers("test_layer_count", "Test int", 2, CVarFlags::read_only);
    CVar<bool> mirror("test_mirror", "Test bool", false);

    CHECK(CVarSystem::find("test_blend_bias") == &blend);
    CHECK(CVarSystem::find("does_not_exist") == nullptr);

    SUBCASE("Set from string") {
        CHECK(CVarSystem::set("test_blend_bias", "0.5").has_value());
        CHECK(blend.get() == doctest::Approx(0.5f));

        CHECK(CVarSystem::set("test_mirror", "true").has_value());
        CHECK(mirror.get());
        CHECK(mirror.toString() == "true");
    }

    SUBCASE("Rejected values") {
        CHECK_FALSE(CVarSystem::set("does_not_exist", "1").has_value());
        CHECK_FALSE(CVarSystem::set("test_layer_count", "5").has_value());
        CHECK(layers.get() == 2);

        auto res = CVarSystem::set("test_blend_bias", "fast");
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().find("test_blend_bias") != std::string::npos);
        CHECK(blend.get() == doctest::Approx(0.25f));
    }

    SUBCASE("Reset restores the default") {
        blend.set(3.0f);
        blend.reset();
        CHECK(blend.get() == doctest::Approx(0.25f));
    }
}

TEST_CASE("CVar leaves the registry when destroyed") {
    {
        CVar<float> temp("test_scoped_cvar", "Scoped", 1.0f);
        CHECK(CVarSystem::find("test_scoped_cvar") != nullptr);
    }
    CHECK(CVarSystem::find("test_scoped_cvar") == nullptr);
}

TEST_CASE("CVar ini persistence") {
    const auto dir = std::filesystem::temp_directory_path() / "kine_cvar_test";
    const auto path = dir / "cvars.ini";
    std::filesystem::remove_all(dir);

    CVar<float> fade("test_saved_fade", "Saved", 0.3f, CVarFlags::save);
    CVar<int> transient("test_transient", "Not saved", 4);

    fade.set(0.8f);
    auto saved = CVarSystem::saveToIni(path);
    REQUIRE(saved.has_value());
    CHECK(*saved >= 1);

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(contents.find("test_saved_fade=") != std::string::npos);
    CHECK(contents.find("test_transient") == std::string::npos);

    fade.set(0.1f);
    {
        std::ofstream out(path, std::ios::app);
        out << "; comment line\n";
        out << "  test_transient = 9  \n";
        out << "test_unknown_name=1\n";
        out << "no equals sign here\n";
    }

    auto loaded = CVarSystem::loadFromIni(path);
    REQUIRE(loaded.has_value());
    CHECK(fade.get() == doctest::Approx(0.8f));
    CHECK(transient.get() == 9);

    CHECK_FALSE(CVarSystem::loadFromIni(dir / "missing.ini").has_value());

    std::filesystem::remove_all(dir);
}

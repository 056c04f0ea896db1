#include <gtest/gtest.h>

#include "key_file.hpp"

#include <filesystem>

TEST(KeyFileTest, ReadsValuesBySection) {
    KeyFile kf;
    ASSERT_TRUE(kf.load_from_string("# boot splash\n[Daemon]\nTheme = deepin-hidpi-logo\nShowDelay=0\n[Other]\nTheme=x\n"));

    std::string value;
    ASSERT_TRUE(kf.get_string("Daemon", "Theme", value));
    EXPECT_EQ(value, "deepin-hidpi-logo");
    ASSERT_TRUE(kf.get_string("Other", "Theme", value));
    EXPECT_EQ(value, "x");
    EXPECT_FALSE(kf.get_string("Daemon", "Missing", value));
    EXPECT_FALSE(kf.get_string("Missing", "Theme", value));
}

TEST(KeyFileTest, RewriteKeepsCommentsAndOrder) {
    KeyFile kf;
    ASSERT_TRUE(kf.load_from_string("; top\n[Theme]\n# note\nA=1\nB=2\n"));
    kf.set_value("Theme", "B", "3");
    kf.set_value("Theme", "C", "4");
    kf.delete_key("Theme", "A");
    kf.set_value("New", "K", "v");

    EXPECT_EQ(kf.to_string(), "; top\n[Theme]\n# note\nB=3\nC=4\n[New]\nK=v\n");
}

TEST(KeyFileTest, RejectsBrokenSectionHeader) {
    KeyFile kf;
    ASSERT_TRUE(kf.load_from_string("[Theme]\nA=1\n"));
    EXPECT_FALSE(kf.load_from_string("[Theme\nA=2\n"));

    // The previous content survives a failed load.
    std::string value;
    ASSERT_TRUE(kf.get_string("Theme", "A", value));
    EXPECT_EQ(value, "1");
}

TEST(KeyFileTest, MissingFileIsReportedAsNotFound) {
    KeyFile kf;
    std::string error;
    bool not_found = false;
    EXPECT_FALSE(kf.load_from_file("/nonexistent/dir/qt-theme.ini", error, &not_found));
    EXPECT_TRUE(not_found);
    EXPECT_FALSE(error.empty());
}

TEST(KeyFileTest, SavesAndReloads) {
    auto path = std::filesystem::temp_directory_path() / "scaled-keyfile-test.ini";
    std::filesystem::remove(path);

    KeyFile kf;
    kf.set_value("Theme", "ScaleLogicalDpi", "-1,-1");
    std::string error;
    ASSERT_TRUE(kf.save_to_file(path.string(), error)) << error;

    KeyFile reloaded;
    ASSERT_TRUE(reloaded.load_from_file(path.string(), error)) << error;
    std::string value;
    ASSERT_TRUE(reloaded.get_string("Theme", "ScaleLogicalDpi", value));
    EXPECT_EQ(value, "-1,-1");
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    std::filesystem::remove(path);
}

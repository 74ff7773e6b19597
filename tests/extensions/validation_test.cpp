#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include "extensions/validation.hpp"

using namespace dbxfer::extensions;
using dbxfer::infra::ErrorCode;

TEST(ValidationTest, DeviceId)
{
    EXPECT_EQ(validate_device_id("emulator-5554").value(), "emulator-5554");
    EXPECT_EQ(validate_device_id("192.168.1.20:5555").value(), "192.168.1.20:5555");
    EXPECT_EQ(validate_device_id("R58M_12AB").value(), "R58M_12AB");

    for (const char* bad : {"", "abc def", "abc;rm", "a|b", "$(id)", "a`b`"}) {
        auto r = validate_device_id(bad);
        ASSERT_FALSE(r) << bad;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    }
}

TEST(ValidationTest, RemotePathAccepted)
{
    EXPECT_EQ(validate_remote_path("  /sdcard/DCIM/Camera  ").value(), "/sdcard/DCIM/Camera");
    EXPECT_EQ(validate_remote_path("/sdcard/My Photos").value(), "/sdcard/My Photos");
    EXPECT_EQ(validate_remote_path("./relative/file.txt").value(), "./relative/file.txt");
    EXPECT_EQ(validate_remote_path("sdcard/file_1.txt").value(), "sdcard/file_1.txt");
}

TEST(ValidationTest, RemotePathRejected)
{
    for (const char* bad : {"", "   ", "/sdcard/a;rm -rf /", "/sdcard/a|b", "/sdcard/a&b",
                            "/sdcard/$(id)", "/sdcard/${HOME}", "/sdcard/`id`",
                            "/sdcard/a\nb", "/sdcard/a>>b", "plain name"}) {
        auto r = validate_remote_path(bad);
        ASSERT_FALSE(r) << bad;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    }

    const std::string with_nul("/sdcard/a\0b", 11);
    EXPECT_FALSE(validate_remote_path(with_nul));
}

TEST(ValidationTest, LocalPathNormalized)
{
    EXPECT_EQ(validate_local_path("/tmp/a/../b/").value(), "/tmp/b");
    EXPECT_EQ(validate_local_path(" /tmp/./x ").value(), "/tmp/x");

    const auto relative = validate_local_path("out");
    ASSERT_TRUE(relative);
    EXPECT_EQ(std::filesystem::path(*relative), std::filesystem::current_path() / "out");
}

TEST(ValidationTest, LocalPathConfinedToBase)
{
    const std::optional<std::string> base = "/data/downloads";
    EXPECT_EQ(validate_local_path("/data/downloads", base).value(), "/data/downloads");
    EXPECT_EQ(validate_local_path("/data/downloads/photos", base).value(), "/data/downloads/photos");

    for (const char* bad : {"/data/downloads/../etc", "/data/downloads2", "/etc/passwd", "/data"}) {
        auto r = validate_local_path(bad, base);
        ASSERT_FALSE(r) << bad;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    }
}

TEST(ValidationTest, LocalPathRejectsControlCharacters)
{
    EXPECT_FALSE(validate_local_path(""));
    EXPECT_FALSE(validate_local_path("/tmp/a\x01b"));
    const std::string with_nul("/tmp/a\0b", 8);
    EXPECT_FALSE(validate_local_path(with_nul));
}

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "mailarchive/share_path.hpp"

TEST(SharePath, NormalizeBasePath) {
    EXPECT_EQ(SharePath::normalizeBasePath("/mail-archive"), "mail-archive");
    EXPECT_EQ(SharePath::normalizeBasePath("/mail-archive/2024/"), "mail-archive\\2024");
    EXPECT_EQ(SharePath::normalizeBasePath("backups\\mail//gmx"), "backups\\mail\\gmx");
    EXPECT_EQ(SharePath::normalizeBasePath("/"), "");
    EXPECT_EQ(SharePath::normalizeBasePath(""), "");
}

TEST(SharePath, Unc) {
    EXPECT_EQ(SharePath::unc("nas", "backup"), "\\\\nas\\backup");
    EXPECT_EQ(SharePath::unc("nas", "backup", "/mail-archive/INBOX"), "\\\\nas\\backup\\mail-archive\\INBOX");
}

TEST(SharePath, JoinConvertsSeparators) {
    EXPECT_EQ(SharePath::join("\\\\nas\\backup\\base", "INBOX/msg/email.raw"), "\\\\nas\\backup\\base\\INBOX\\msg\\email.raw");
    EXPECT_EQ(SharePath::join("\\\\nas\\backup\\base\\", "a"), "\\\\nas\\backup\\base\\a");
    EXPECT_EQ(SharePath::join("\\\\nas\\backup", ""), "\\\\nas\\backup");
}

TEST(SharePath, ParentStopsAtShareRoot) {
    EXPECT_EQ(SharePath::parent("\\\\nas\\backup\\a\\b"), "\\\\nas\\backup\\a");
    EXPECT_EQ(SharePath::parent("\\\\nas\\backup\\a"), "\\\\nas\\backup");
    EXPECT_EQ(SharePath::parent("\\\\nas\\backup"), "\\\\nas\\backup");
}

TEST(SharePath, Segments) {
    std::vector<std::string> expected = {"", "", "nas", "backup", "a", "b"};
    EXPECT_EQ(SharePath::segments("\\\\nas\\backup\\a\\b"), expected);
}

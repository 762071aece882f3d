#include <gtest/gtest.h>
#include <string>

#include "mailarchive/archive_exception.hpp"

TEST(ArchiveException, WhatJoinsKeyAndDebugInfo) {
    ArchiveException ex(ErrorKind::FolderAccess, "ErrorFolderNotFound", "Archive/2019");
    EXPECT_STREQ(ex.what(), "ErrorFolderNotFound: Archive/2019");
    EXPECT_EQ(ex.kind, ErrorKind::FolderAccess);
}

TEST(ArchiveException, MapsMailcoreErrorCodes) {
    ArchiveException ex(ErrorKind::Connection, mailcore::ErrorAuthentication, "login");
    EXPECT_EQ(ex.key, "ErrorAuthentication");
    EXPECT_STREQ(ex.what(), "ErrorAuthentication: login");
}

TEST(ArchiveException, JSONCarriesKindKeyAndMessage) {
    ArchiveException ex(ErrorKind::Connection, mailcore::ErrorConnection, "imap.example.com");
    nlohmann::json j = ex.toJSON();

    EXPECT_EQ(j["kind"], "ConnectionError");
    EXPECT_EQ(j["key"], "ErrorConnection");
    EXPECT_EQ(j["debuginfo"], "imap.example.com");
    EXPECT_EQ(j["what"], "ErrorConnection: imap.example.com");
    EXPECT_EQ(j.size(), 4u);
}

TEST(ArchiveException, ToErrorKeepsFields) {
    ArchiveError err = ArchiveException(ErrorKind::PerItem, "ErrorFile", "disk full").toError();
    EXPECT_EQ(err.kind, ErrorKind::PerItem);
    EXPECT_EQ(err.describe(), "ErrorFile: disk full");
}

TEST(ArchiveError, DescribeWithoutDebugInfoIsTheKey) {
    ArchiveError err;
    err.key = "InvalidFormat";
    EXPECT_EQ(err.describe(), "InvalidFormat");
}

TEST(ArchiveError, KindNames) {
    EXPECT_EQ(ErrorKindName(ErrorKind::Connection), "ConnectionError");
    EXPECT_EQ(ErrorKindName(ErrorKind::FolderAccess), "FolderAccessError");
    EXPECT_EQ(ErrorKindName(ErrorKind::PerItem), "PerItemError");
    EXPECT_EQ(ErrorKindName(ErrorKind::Configuration), "ConfigurationError");
}

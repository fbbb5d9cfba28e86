#include <gtest/gtest.h>
#include "maildrive/drive_exception.hpp"

#include <string>

TEST(DriveException, SerializesKeyAndMessage) {
    DriveException ex("bad-name", "A file name cannot be empty.", "upload");
    nlohmann::json json = ex.toJSON();

    EXPECT_EQ("bad-name", json["key"].get<std::string>());
    EXPECT_EQ("A file name cannot be empty.", json["what"].get<std::string>());
    EXPECT_EQ("upload", json["debuginfo"].get<std::string>());
    EXPECT_FALSE(json["retryable"].get<bool>());
}

TEST(DriveException, IncompletePartSetListsMissingPartsOneBased) {
    IncompletePartSetException ex("report.pdf", 4, 2, {0, 2});

    EXPECT_EQ("incomplete-part-set", ex.key);
    EXPECT_NE(std::string::npos, std::string(ex.what()).find("2 of 4"));
    EXPECT_NE(std::string::npos, std::string(ex.what()).find("missing part(s) 1, 3"));

    nlohmann::json json = ex.toJSON();
    EXPECT_EQ(4u, json["expected"].get<unsigned int>());
    EXPECT_EQ((std::vector<unsigned int>{0, 2}), json["missing"].get<std::vector<unsigned int>>());
}

TEST(DriveException, DuplicatePartNamesConflictingMessages) {
    DuplicatePartException ex("report.pdf", 1, {8, 9});

    EXPECT_EQ("duplicate-part", ex.key);
    EXPECT_NE(std::string::npos, std::string(ex.what()).find("part 2 (UIDs 8, 9)"));
}

TEST(DriveException, ConnectionErrorsAreRetryableAndOffline) {
    TransportException connection(mailcore::ErrorConnection, "connectIfNeeded");
    EXPECT_EQ("ErrorConnection", connection.key);
    EXPECT_TRUE(connection.isRetryable());
    EXPECT_TRUE(connection.isOffline());

    TransportException authentication(mailcore::ErrorAuthentication, "loginIfNeeded");
    EXPECT_EQ("ErrorAuthentication", authentication.key);
    EXPECT_FALSE(authentication.isRetryable());
    EXPECT_FALSE(authentication.isOffline());
}

TEST(DriveException, PartialUploadSuggestsResumePoint) {
    TransportException cause(mailcore::ErrorAppend, "appendMessage");
    PartialTransferException ex("upload", "video.mp4", 3, 5, 2, cause);

    EXPECT_EQ("partial-upload", ex.key);
    EXPECT_EQ("ErrorAppend", ex.causeKey);
    EXPECT_NE(std::string::npos, std::string(ex.what()).find("--start-chunk 5"));

    nlohmann::json json = ex.toJSON();
    EXPECT_EQ(3u, json["succeeded"].get<unsigned int>());
    EXPECT_EQ("ErrorAppend", json["cause"].get<std::string>());
}

TEST(DriveException, PartialRemoveHasNoResumePoint) {
    TransportException cause(mailcore::ErrorStore, "storeFlagsByUID");
    PartialTransferException ex("remove", "video.mp4", 1, 5, 0, cause);

    EXPECT_EQ("partial-remove", ex.key);
    EXPECT_EQ(std::string::npos, std::string(ex.what()).find("--start-chunk"));
}

#include <gtest/gtest.h>
#include "maildrive/models/logical_file.hpp"
#include "maildrive/models/virtual_folder.hpp"
#include "maildrive/drive_exception.hpp"

static RemoteMessage message(uint32_t id, std::string subject, uint64_t size, time_t date) {
    RemoteMessage m;
    m.id = id;
    m.folderId = "maildrive/docs";
    m.subject = subject;
    m.attachmentSize = size;
    m.date = date;
    return m;
}

TEST(VirtualFolder, GroupsPartsByName) {
    VirtualFolder folder({"docs"});
    folder.addMessage(message(1, "b.txt.part2of2", 10, 100));
    folder.addMessage(message(2, "a.txt.part1of1", 5, 200));
    folder.addMessage(message(3, "b.txt.part1of2", 30, 300));

    std::vector<std::shared_ptr<LogicalFile>> files = folder.files();
    ASSERT_EQ(2u, files.size());
    EXPECT_EQ("a.txt", files[0]->name());
    EXPECT_EQ("b.txt", files[1]->name());
    EXPECT_EQ("docs/b.txt", files[1]->path());
    EXPECT_EQ(2u, files[1]->messages().size());

    EXPECT_EQ(files[1], folder.file("b.txt"));
    EXPECT_EQ(nullptr, folder.file("c.txt"));
    EXPECT_EQ("docs", folder.name());
}

TEST(VirtualFolder, RejectsForeignMessages) {
    VirtualFolder folder({});
    EXPECT_THROW(folder.addMessage(message(1, "Welcome to Yahoo!", 0, 0)), MalformedPartException);
    EXPECT_TRUE(folder.files().empty());
}

TEST(VirtualFolder, SortsChildren) {
    VirtualFolder folder({});
    folder.addChild("photos");
    folder.addChild("music");
    folder.addChild("photos");
    EXPECT_EQ((std::vector<std::string>{"music", "photos"}), folder.children());
}

TEST(LogicalFile, SummarizesParts) {
    LogicalFile file("b.txt", {"docs"});
    file.addPart(message(1, "b.txt.part3of3", 10, 100), ChunkCodec::decodeMetadata("b.txt.part3of3"));
    file.addPart(message(2, "b.txt.part1of3", 30, 300), ChunkCodec::decodeMetadata("b.txt.part1of3"));

    EXPECT_EQ(3u, file.totalParts());
    EXPECT_EQ(2u, file.partsPresent());
    EXPECT_TRUE(file.consistent());
    EXPECT_FALSE(file.complete());
    EXPECT_EQ(40u, file.size());
    EXPECT_EQ(300, file.lastModified());

    file.addPart(message(3, "b.txt.part2of3", 30, 200), ChunkCodec::decodeMetadata("b.txt.part2of3"));
    EXPECT_TRUE(file.complete());
    EXPECT_EQ(70u, file.size());
}

TEST(LogicalFile, DuplicatesDoNotAddToSize) {
    LogicalFile file("a.txt", {});
    file.addPart(message(1, "a.txt.part1of1", 5, 100), ChunkCodec::decodeMetadata("a.txt.part1of1"));
    file.addPart(message(2, "a.txt.part1of1", 5, 200), ChunkCodec::decodeMetadata("a.txt.part1of1"));

    EXPECT_TRUE(file.complete());
    EXPECT_EQ(5u, file.size());
    EXPECT_EQ(1u, file.partsPresent());
}

TEST(LogicalFile, DisagreeingCountsAreInconsistent) {
    LogicalFile file("a.txt", {});
    file.addPart(message(1, "a.txt.part1of2", 5, 100), ChunkCodec::decodeMetadata("a.txt.part1of2"));
    file.addPart(message(2, "a.txt.part2of3", 5, 200), ChunkCodec::decodeMetadata("a.txt.part2of3"));

    EXPECT_FALSE(file.consistent());
    EXPECT_FALSE(file.complete());
    EXPECT_EQ(3u, file.totalParts());
}

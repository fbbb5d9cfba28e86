#include <gtest/gtest.h>
#include "maildrive/chunk_codec.hpp"
#include "maildrive/drive_exception.hpp"

#include <string>
#include <vector>

static Part makePart(std::string name, unsigned int index, unsigned int total, std::string payload, uint32_t uid = 0) {
    Part part;
    part.metadata.name = name;
    part.metadata.index = index;
    part.metadata.totalParts = total;
    part.messageId = uid;
    part.payload = payload;
    return part;
}

static PartMetadata makeMetadata(std::string name, unsigned int index, unsigned int total) {
    PartMetadata metadata;
    metadata.name = name;
    metadata.index = index;
    metadata.totalParts = total;
    return metadata;
}

TEST(ChunkCodecTest, PartCountRoundsUp) {
    const size_t MB = 1024 * 1024;
    EXPECT_EQ(3u, ChunkCodec::partCount(70 * MB, 29 * MB));
    EXPECT_EQ(2u, ChunkCodec::partCount(58 * MB, 29 * MB));
    EXPECT_EQ(2u, ChunkCodec::partCount(58 * MB + 1, 29 * MB + 1));
    EXPECT_EQ(1u, ChunkCodec::partCount(1, 29 * MB));
}

TEST(ChunkCodecTest, EmptyFileHasOnePart) {
    EXPECT_EQ(1u, ChunkCodec::partCount(0, 29));
    std::vector<std::string> parts = ChunkCodec::split("", 29);
    ASSERT_EQ(1u, parts.size());
    EXPECT_EQ("", parts[0]);
}

TEST(ChunkCodecTest, ZeroPartSizeIsRejected) {
    try {
        ChunkCodec::partCount(10, 0);
        FAIL() << "Expected DriveException";
    } catch (DriveException & ex) {
        EXPECT_EQ("bad-part-size", ex.key);
    }
}

TEST(ChunkCodecTest, SplitSeventyIntoTwentyNines) {
    std::string bytes;
    for (int ii = 0; ii < 70 * 1024; ii ++) {
        bytes += (char)(ii % 251);
    }
    std::vector<std::string> parts = ChunkCodec::split(bytes, 29 * 1024);

    ASSERT_EQ(3u, parts.size());
    EXPECT_EQ(29u * 1024, parts[0].size());
    EXPECT_EQ(29u * 1024, parts[1].size());
    EXPECT_EQ(12u * 1024, parts[2].size());
    EXPECT_EQ(bytes, parts[0] + parts[1] + parts[2]);
}

TEST(ChunkCodecTest, JoinReassemblesOutOfOrderParts) {
    std::string bytes = "The quick brown fox jumps over the lazy dog";
    std::vector<std::string> pieces = ChunkCodec::split(bytes, 10);
    unsigned int total = (unsigned int)pieces.size();

    std::vector<Part> parts;
    for (unsigned int ii = total; ii > 0; ii --) {
        parts.push_back(makePart("fox.txt", ii - 1, total, pieces[ii - 1], ii));
    }
    EXPECT_EQ(bytes, ChunkCodec::join(parts));
}

TEST(ChunkCodecTest, JoinPreservesBinaryContent) {
    std::string bytes("\0\x01\xff\r\n\0", 6);
    std::vector<std::string> pieces = ChunkCodec::split(bytes, 4);
    std::vector<Part> parts{makePart("bin", 0, 2, pieces[0]), makePart("bin", 1, 2, pieces[1])};
    EXPECT_EQ(bytes, ChunkCodec::join(parts));
}

TEST(ChunkCodecTest, JoinAcceptsIdenticalDuplicates) {
    std::vector<Part> parts{
        makePart("a", 0, 2, "hello ", 1),
        makePart("a", 1, 2, "world", 2),
        makePart("a", 0, 2, "hello ", 3),
    };
    EXPECT_EQ("hello world", ChunkCodec::join(parts));
}

TEST(ChunkCodecTest, JoinRejectsConflictingDuplicates) {
    std::vector<Part> parts{
        makePart("a", 0, 2, "hello ", 7),
        makePart("a", 1, 2, "world", 8),
        makePart("a", 1, 2, "there", 9),
    };
    try {
        ChunkCodec::join(parts);
        FAIL() << "Expected DuplicatePartException";
    } catch (DuplicatePartException & ex) {
        EXPECT_EQ("duplicate-part", ex.key);
        EXPECT_EQ(1u, ex.index);
        EXPECT_EQ((std::vector<uint32_t>{8, 9}), ex.messageIds);
    }
}

TEST(ChunkCodecTest, JoinRejectsMissingPart) {
    std::vector<Part> parts{makePart("a", 0, 3, "x"), makePart("a", 2, 3, "z")};
    try {
        ChunkCodec::join(parts);
        FAIL() << "Expected IncompletePartSetException";
    } catch (IncompletePartSetException & ex) {
        EXPECT_EQ("incomplete-part-set", ex.key);
        EXPECT_EQ(3u, ex.expected);
        EXPECT_EQ(2u, ex.observed);
        EXPECT_EQ(std::vector<unsigned int>{1}, ex.missing);
        EXPECT_NE(std::string(ex.what()).find("missing part(s) 2"), std::string::npos);
    }
}

TEST(ChunkCodecTest, CheckCompleteRejectsDisagreeingTotals) {
    std::vector<PartMetadata> parts{makeMetadata("a", 0, 2), makeMetadata("a", 1, 3)};
    try {
        ChunkCodec::checkComplete(parts);
        FAIL() << "Expected IncompletePartSetException";
    } catch (IncompletePartSetException & ex) {
        EXPECT_EQ("part-count-mismatch", ex.key);
    }
}

TEST(ChunkCodecTest, CheckCompleteRejectsMixedNames) {
    std::vector<PartMetadata> parts{makeMetadata("a", 0, 2), makeMetadata("b", 1, 2)};
    EXPECT_THROW(ChunkCodec::checkComplete(parts), IncompletePartSetException);
}

TEST(ChunkCodecTest, CheckCompleteRejectsEmptySet) {
    EXPECT_THROW(ChunkCodec::checkComplete({}), IncompletePartSetException);
}

TEST(ChunkCodecTest, EncodeMetadataFormat) {
    EXPECT_EQ("photo.jpg.part1of3", ChunkCodec::encodeMetadata("photo.jpg", 0, 3));
    EXPECT_EQ("photo.jpg.part3of3", ChunkCodec::encodeMetadata("photo.jpg", 2, 3));
    EXPECT_EQ("empty.part1of1", ChunkCodec::encodeMetadata(makeMetadata("empty", 0, 1)));
}

TEST(ChunkCodecTest, EncodeMetadataRejectsBadInput) {
    try {
        ChunkCodec::encodeMetadata("", 0, 1);
        FAIL() << "Expected DriveException";
    } catch (DriveException & ex) {
        EXPECT_EQ("bad-name", ex.key);
    }
    try {
        ChunkCodec::encodeMetadata("a", 3, 3);
        FAIL() << "Expected DriveException";
    } catch (DriveException & ex) {
        EXPECT_EQ("bad-part-index", ex.key);
    }
    EXPECT_THROW(ChunkCodec::encodeMetadata("a", 0, 0), DriveException);
}

TEST(ChunkCodecTest, MetadataSurvivesTrickyNames) {
    std::vector<std::string> names = {
        "plain.txt",
        "archive.part2of9.zip",
        "ends.part1of1",
        "50% off/sale.pdf",
        "r\xC3\xA9sum\xC3\xA9.pdf",
        "tab\there",
        "%2F",
    };
    for (const auto & name : names) {
        std::string subject = ChunkCodec::encodeMetadata(name, 4, 12);
        EXPECT_EQ(std::string::npos, subject.find('/')) << subject;

        PartMetadata decoded = ChunkCodec::decodeMetadata(subject);
        EXPECT_EQ(name, decoded.name);
        EXPECT_EQ(4u, decoded.index);
        EXPECT_EQ(12u, decoded.totalParts);
    }
}

TEST(ChunkCodecTest, EscapeOnlyTouchesReservedBytes) {
    EXPECT_EQ("a%2Fb%25c", ChunkCodec::escapeName("a/b%c"));
    EXPECT_EQ("r\xC3\xA9sum\xC3\xA9", ChunkCodec::escapeName("r\xC3\xA9sum\xC3\xA9"));
    EXPECT_EQ("a/b%c", ChunkCodec::unescapeName("a%2fb%25c"));
}

TEST(ChunkCodecTest, DecodeMetadataRejectsForeignSubjects) {
    std::vector<std::string> subjects = {
        "",
        "Welcome to your new mailbox",
        "file.part",
        "file.part1",
        "file.part1of",
        "file.partof3",
        "file.part0of3",
        "file.part4of3",
        "file.part1of0",
        "file.parta1of3",
        "file.part1of3x",
        "file.part-1of3",
        "file.part1of99999999999",
        ".part1of1",
        "bad%2.part1of1",
        "bad%zz.part1of1",
    };
    for (const auto & subject : subjects) {
        try {
            ChunkCodec::decodeMetadata(subject);
            ADD_FAILURE() << "Expected MalformedPartException for '" << subject << "'";
        } catch (MalformedPartException & ex) {
            EXPECT_EQ("malformed-part", ex.key);
            EXPECT_EQ(subject, ex.subject);
        }
    }
}

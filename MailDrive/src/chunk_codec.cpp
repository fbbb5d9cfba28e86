#include "maildrive/chunk_codec.hpp"
#include "maildrive/drive_exception.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>

static const std::string PART_MARKER = ".part";
static const std::string OF_MARKER = "of";
static const char HEX_DIGITS[] = "0123456789ABCDEF";

static bool parseCounter(const std::string & digits, unsigned int * out) {
    if (digits.empty() || digits.size() > 10) {
        return false;
    }
    uint64_t value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (uint64_t)(c - '0');
    }
    if (value > std::numeric_limits<unsigned int>::max()) {
        return false;
    }
    *out = (unsigned int)value;
    return true;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

unsigned int ChunkCodec::partCount(uint64_t size, size_t maxPartSize) {
    if (maxPartSize == 0) {
        throw DriveException("bad-part-size", "The maximum part size must be at least one byte.");
    }
    if (size == 0) {
        return 1;
    }
    uint64_t count = (size - 1) / maxPartSize + 1;
    if (count > std::numeric_limits<unsigned int>::max()) {
        throw DriveException("bad-part-size", "The file is too large to be split with a part size of " + std::to_string(maxPartSize) + " bytes.");
    }
    return (unsigned int)count;
}

std::vector<std::string> ChunkCodec::split(const std::string & bytes, size_t maxPartSize) {
    unsigned int count = partCount(bytes.size(), maxPartSize);
    std::vector<std::string> parts;
    parts.reserve(count);

    for (unsigned int ii = 0; ii < count; ii ++) {
        size_t offset = (size_t)ii * maxPartSize;
        parts.push_back(bytes.substr(offset, maxPartSize));
    }
    return parts;
}

std::string ChunkCodec::escapeName(const std::string & name) {
    std::string escaped;
    escaped.reserve(name.size());

    for (char ch : name) {
        unsigned char c = (unsigned char)ch;
        if (c == '%' || c == '/' || c < 0x20 || c == 0x7F) {
            escaped += '%';
            escaped += HEX_DIGITS[c >> 4];
            escaped += HEX_DIGITS[c & 0x0F];
        } else {
            escaped += ch;
        }
    }
    return escaped;
}

std::string ChunkCodec::unescapeName(const std::string & escaped) {
    std::string name;
    name.reserve(escaped.size());

    for (size_t ii = 0; ii < escaped.size(); ii ++) {
        if (escaped[ii] != '%') {
            name += escaped[ii];
            continue;
        }
        if (ii + 2 >= escaped.size()) {
            throw std::invalid_argument("truncated escape sequence");
        }
        int hi = hexValue(escaped[ii + 1]);
        int lo = hexValue(escaped[ii + 2]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid escape sequence");
        }
        name += (char)((hi << 4) | lo);
        ii += 2;
    }
    return name;
}

std::string ChunkCodec::encodeMetadata(const std::string & name, unsigned int index, unsigned int totalParts) {
    if (name.empty()) {
        throw DriveException("bad-name", "A file name cannot be empty.");
    }
    if (totalParts == 0 || index >= totalParts) {
        throw DriveException("bad-part-index", "Part " + std::to_string(index) + " is out of range for a file of " + std::to_string(totalParts) + " part(s).");
    }
    return escapeName(name) + PART_MARKER + std::to_string(index + 1) + OF_MARKER + std::to_string(totalParts);
}

std::string ChunkCodec::encodeMetadata(const PartMetadata & metadata) {
    return encodeMetadata(metadata.name, metadata.index, metadata.totalParts);
}

PartMetadata ChunkCodec::decodeMetadata(const std::string & subject) {
    size_t marker = subject.rfind(PART_MARKER);
    if (marker == std::string::npos) {
        throw MalformedPartException(subject, "no part marker");
    }

    std::string counters = subject.substr(marker + PART_MARKER.size());
    size_t of = counters.find(OF_MARKER);
    if (of == std::string::npos) {
        throw MalformedPartException(subject, "no part count");
    }

    unsigned int ordinal = 0;
    unsigned int total = 0;
    if (!parseCounter(counters.substr(0, of), &ordinal) || !parseCounter(counters.substr(of + OF_MARKER.size()), &total)) {
        throw MalformedPartException(subject, "part counters are not numeric");
    }
    if (total == 0) {
        throw MalformedPartException(subject, "part count is zero");
    }
    if (ordinal == 0 || ordinal > total) {
        throw MalformedPartException(subject, "part index is out of range");
    }

    PartMetadata metadata;
    try {
        metadata.name = unescapeName(subject.substr(0, marker));
    } catch (std::invalid_argument & ex) {
        throw MalformedPartException(subject, ex.what());
    }
    if (metadata.name.empty()) {
        throw MalformedPartException(subject, "file name is empty");
    }
    metadata.index = ordinal - 1;
    metadata.totalParts = total;
    return metadata;
}

void ChunkCodec::checkComplete(const std::vector<PartMetadata> & parts) {
    if (parts.empty()) {
        throw IncompletePartSetException("", "incomplete-part-set", "There are no parts to assemble.");
    }

    const PartMetadata & first = parts.front();
    std::set<unsigned int> seen;

    for (const auto & part : parts) {
        if (part.name != first.name) {
            throw IncompletePartSetException(first.name, "part-count-mismatch", "Parts of '" + first.name + "' and '" + part.name + "' cannot be assembled together.");
        }
        if (part.totalParts != first.totalParts) {
            throw IncompletePartSetException(first.name, "part-count-mismatch",
                "The parts of '" + first.name + "' disagree on the number of parts (" +
                std::to_string(first.totalParts) + " vs " + std::to_string(part.totalParts) + ").");
        }
        if (part.index >= part.totalParts) {
            throw IncompletePartSetException(first.name, "part-count-mismatch",
                "Part " + std::to_string(part.index + 1) + " of '" + first.name + "' is beyond the declared " + std::to_string(part.totalParts) + " part(s).");
        }
        seen.insert(part.index);
    }

    if (seen.size() != first.totalParts) {
        std::vector<unsigned int> missing;
        for (unsigned int ii = 0; ii < first.totalParts; ii ++) {
            if (!seen.count(ii)) {
                missing.push_back(ii);
            }
        }
        throw IncompletePartSetException(first.name, first.totalParts, (unsigned int)seen.size(), missing);
    }
}

std::string ChunkCodec::join(std::vector<Part> parts) {
    std::vector<PartMetadata> metadata;
    metadata.reserve(parts.size());
    for (const auto & part : parts) {
        metadata.push_back(part.metadata);
    }
    checkComplete(metadata);

    std::stable_sort(parts.begin(), parts.end(), [](const Part & a, const Part & b) {
        return a.metadata.index < b.metadata.index;
    });

    // Identical copies of a part are harmless (eg: the same file uploaded twice),
    // but two different payloads for one index can't be resolved by guessing.
    std::map<unsigned int, std::vector<uint32_t>> conflicts;
    size_t totalSize = 0;
    for (size_t ii = 0; ii < parts.size(); ii ++) {
        if (ii > 0 && parts[ii].metadata.index == parts[ii - 1].metadata.index) {
            size_t first = ii - 1;
            while (first > 0 && parts[first - 1].metadata.index == parts[ii].metadata.index) {
                first --;
            }
            if (parts[ii].payload != parts[first].payload) {
                unsigned int index = parts[ii].metadata.index;
                if (!conflicts.count(index)) {
                    conflicts[index].push_back(parts[first].messageId);
                }
                conflicts[index].push_back(parts[ii].messageId);
            }
            continue;
        }
        totalSize += parts[ii].payload.size();
    }

    if (!conflicts.empty()) {
        auto conflict = conflicts.begin();
        throw DuplicatePartException(parts.front().metadata.name, conflict->first, conflict->second);
    }

    std::string bytes;
    bytes.reserve(totalSize);
    for (size_t ii = 0; ii < parts.size(); ii ++) {
        if (ii > 0 && parts[ii].metadata.index == parts[ii - 1].metadata.index) {
            continue;
        }
        bytes.append(parts[ii].payload);
    }
    return bytes;
}

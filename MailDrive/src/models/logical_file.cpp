#include "maildrive/models/logical_file.hpp"
#include "maildrive/path_mapper.hpp"

#include <algorithm>
#include <set>

LogicalFile::LogicalFile(std::string name, std::vector<std::string> folder) :
    _name(name), _folder(folder)
{
}

void LogicalFile::addPart(const RemoteMessage & message, const PartMetadata & metadata) {
    _messages.push_back(message);
    _parts.push_back(metadata);
}

std::string LogicalFile::name() const {
    return _name;
}

std::vector<std::string> LogicalFile::folder() const {
    return _folder;
}

std::string LogicalFile::path() const {
    std::vector<std::string> segments = _folder;
    segments.push_back(_name);
    return PathMapper::format(segments);
}

const std::vector<RemoteMessage> & LogicalFile::messages() const {
    return _messages;
}

const std::vector<PartMetadata> & LogicalFile::parts() const {
    return _parts;
}

unsigned int LogicalFile::totalParts() const {
    unsigned int total = 0;
    for (const auto & part : _parts) {
        total = std::max(total, part.totalParts);
    }
    return total;
}

unsigned int LogicalFile::partsPresent() const {
    unsigned int total = totalParts();
    std::set<unsigned int> seen;
    for (const auto & part : _parts) {
        if (part.index < total) {
            seen.insert(part.index);
        }
    }
    return (unsigned int)seen.size();
}

bool LogicalFile::consistent() const {
    for (const auto & part : _parts) {
        if (part.totalParts != _parts.front().totalParts) {
            return false;
        }
    }
    return true;
}

bool LogicalFile::complete() const {
    return !_parts.empty() && consistent() && partsPresent() == totalParts();
}

uint64_t LogicalFile::size() const {
    // count each index once, duplicates don't add to the file
    std::set<unsigned int> seen;
    uint64_t size = 0;
    for (size_t ii = 0; ii < _parts.size(); ii ++) {
        if (seen.insert(_parts[ii].index).second) {
            size += _messages[ii].attachmentSize;
        }
    }
    return size;
}

time_t LogicalFile::lastModified() const {
    time_t date = 0;
    for (const auto & message : _messages) {
        date = std::max(date, message.date);
    }
    return date;
}

nlohmann::json LogicalFile::toJSON() const {
    std::vector<uint32_t> ids;
    for (const auto & message : _messages) {
        ids.push_back(message.id);
    }
    return {
        {"name", _name},
        {"path", path()},
        {"size", size()},
        {"partsPresent", partsPresent()},
        {"totalParts", totalParts()},
        {"complete", complete()},
        {"lastModified", lastModified()},
        {"messageIds", ids},
    };
}

#include "maildrive/path_mapper.hpp"
#include "maildrive/drive_exception.hpp"

PathMapper::PathMapper(std::string baseFolder, char delimiter) :
    _baseFolder(baseFolder), _delimiter(delimiter)
{
    if (_baseFolder.empty()) {
        throw InvalidSegmentException("bad-base-folder", _baseFolder, "the base folder name cannot be empty");
    }
    if (_delimiter == 0) {
        // Servers with a flat namespace report no delimiter (NIL).
        _delimiter = '/';
    }
}

std::string PathMapper::baseFolder() const {
    return _baseFolder;
}

char PathMapper::delimiter() const {
    return _delimiter;
}

void PathMapper::validateSegment(const std::string & segment) const {
    if (segment.empty()) {
        throw InvalidSegmentException(segment, "folder names cannot be empty");
    }
    if (segment == "." || segment == "..") {
        throw InvalidSegmentException(segment, "relative folder names are not supported");
    }
    for (char ch : segment) {
        unsigned char c = (unsigned char)ch;
        if (ch == _delimiter || ch == '/') {
            throw InvalidSegmentException(segment, std::string("folder names cannot contain '") + ch + "'");
        }
        if (ch == '*' || ch == '%') {
            throw InvalidSegmentException(segment, std::string("'") + ch + "' is an IMAP wildcard");
        }
        if (c < 0x20 || c == 0x7F) {
            throw InvalidSegmentException(segment, "folder names cannot contain control characters");
        }
    }
}

std::string PathMapper::encode(const std::vector<std::string> & segments) const {
    std::string identifier = _baseFolder;
    for (const auto & segment : segments) {
        validateSegment(segment);
        identifier += _delimiter;
        identifier += segment;
    }
    return identifier;
}

bool PathMapper::contains(const std::string & identifier) const {
    if (identifier == _baseFolder) {
        return true;
    }
    return (identifier.size() > _baseFolder.size() + 1) &&
           (identifier.compare(0, _baseFolder.size(), _baseFolder) == 0) &&
           (identifier[_baseFolder.size()] == _delimiter);
}

std::vector<std::string> PathMapper::decode(const std::string & identifier) const {
    if (!contains(identifier)) {
        throw InvalidSegmentException("foreign-folder", identifier, "the folder is outside of '" + _baseFolder + "'");
    }

    std::vector<std::string> segments;
    if (identifier == _baseFolder) {
        return segments;
    }

    std::string rest = identifier.substr(_baseFolder.size() + 1);
    size_t start = 0;
    while (true) {
        size_t end = rest.find(_delimiter, start);
        std::string segment = rest.substr(start, end == std::string::npos ? std::string::npos : end - start);
        validateSegment(segment);
        segments.push_back(segment);
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return segments;
}

size_t PathMapper::depth(const std::string & identifier) const {
    return decode(identifier).size();
}

std::vector<std::string> PathMapper::parse(const std::string & remotePath) {
    std::vector<std::string> segments;
    std::string current;
    for (char ch : remotePath) {
        if (ch == '/') {
            if (!current.empty()) {
                segments.push_back(current);
            }
            current = "";
        } else {
            current += ch;
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

std::string PathMapper::format(const std::vector<std::string> & segments) {
    std::string path;
    for (size_t ii = 0; ii < segments.size(); ii ++) {
        if (ii > 0) {
            path += "/";
        }
        path += segments[ii];
    }
    return path;
}

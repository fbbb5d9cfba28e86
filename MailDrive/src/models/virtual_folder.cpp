#include "maildrive/models/virtual_folder.hpp"
#include "maildrive/path_mapper.hpp"

VirtualFolder::VirtualFolder(std::vector<std::string> path) :
    _path(path)
{
}

std::vector<std::string> VirtualFolder::path() const {
    return _path;
}

std::string VirtualFolder::name() const {
    return _path.empty() ? "" : _path.back();
}

std::shared_ptr<LogicalFile> VirtualFolder::addMessage(const RemoteMessage & message) {
    PartMetadata metadata = ChunkCodec::decodeMetadata(message.subject);

    std::shared_ptr<LogicalFile> file = _files[metadata.name];
    if (file == nullptr) {
        file = std::make_shared<LogicalFile>(metadata.name, _path);
        _files[metadata.name] = file;
    }
    file->addPart(message, metadata);
    return file;
}

void VirtualFolder::addChild(std::string name) {
    _children.insert(name);
}

std::vector<std::shared_ptr<LogicalFile>> VirtualFolder::files() const {
    std::vector<std::shared_ptr<LogicalFile>> results;
    for (const auto & pair : _files) {
        results.push_back(pair.second);
    }
    return results;
}

std::shared_ptr<LogicalFile> VirtualFolder::file(std::string name) const {
    auto it = _files.find(name);
    return it == _files.end() ? nullptr : it->second;
}

std::vector<std::string> VirtualFolder::children() const {
    return std::vector<std::string>(_children.begin(), _children.end());
}

nlohmann::json VirtualFolder::toJSON() const {
    nlohmann::json files = nlohmann::json::array();
    for (const auto & pair : _files) {
        files.push_back(pair.second->toJSON());
    }
    return {
        {"path", PathMapper::format(_path)},
        {"children", children()},
        {"files", files},
    };
}

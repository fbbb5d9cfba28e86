#include "maildrive/listing_engine.hpp"
#include "maildrive/chunk_codec.hpp"
#include "maildrive/drive_exception.hpp"
#include "maildrive/mail_utils.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>

std::string ListingEntry::displayPath() const {
    std::string display = PathMapper::format(path);
    return kind == Folder ? display + "/" : display;
}

nlohmann::json ListingEntry::toJSON() const {
    nlohmann::json j = {
        {"kind", kind == Folder ? "folder" : "file"},
        {"path", PathMapper::format(path)},
        {"name", name},
    };
    if (kind == File) {
        j["size"] = size;
        j["partsPresent"] = partsPresent;
        j["totalParts"] = totalParts;
        j["valid"] = valid;
        j["date"] = date;
    }
    return j;
}

Listing::Listing(ListingEngine * engine, std::vector<std::string> folder, bool recurse, int maxDepth) :
    engine(engine), folder(folder), recurse(recurse), maxDepth(maxDepth)
{
}

void Listing::each(std::function<bool(const ListingEntry &)> visitor) {
    std::string rootId = engine->mapper.encode(folder);

    if (!engine->transport->folderExists(rootId)) {
        if (folder.empty()) {
            // nothing has been uploaded yet
            engine->logger->info("-- {} does not exist yet, nothing to list.", rootId);
            return;
        }
        throw NotFoundException("folder-not-found", PathMapper::format(folder), "The folder '" + PathMapper::format(folder) + "' does not exist.");
    }

    FolderTree tree;
    if (recurse) {
        for (const auto & folderId : engine->transport->listFolders(rootId)) {
            std::vector<std::string> segments;
            try {
                segments = engine->mapper.decode(folderId);
            } catch (InvalidSegmentException & ex) {
                engine->logger->debug("-- Skipping folder {}: {}", folderId, ex.what());
                continue;
            }
            if (segments.size() <= folder.size()) {
                continue;
            }

            // intermediate folders are implied by their descendants
            std::vector<std::string> parent;
            for (size_t ii = folder.size(); ii < segments.size(); ii ++) {
                tree[parent].insert(segments[ii]);
                parent.push_back(segments[ii]);
            }
        }
    }

    visitFolder({}, tree, visitor);
}

bool Listing::visitFolder(const std::vector<std::string> & relative, FolderTree & tree, const std::function<bool(const ListingEntry &)> & visitor) {
    std::vector<std::string> absolute = folder;
    absolute.insert(absolute.end(), relative.begin(), relative.end());

    VirtualFolder contents = engine->loadFolder(absolute);

    for (const auto & file : contents.files()) {
        ListingEntry entry;
        entry.kind = ListingEntry::File;
        entry.path = relative;
        entry.path.push_back(file->name());
        entry.name = file->name();
        entry.size = file->size();
        entry.partsPresent = file->partsPresent();
        entry.totalParts = file->totalParts();
        entry.valid = file->complete();
        entry.date = file->lastModified();
        if (!visitor(entry)) {
            return false;
        }
    }

    if (!recurse) {
        return true;
    }

    for (const auto & child : tree[relative]) {
        contents.addChild(child);
    }

    for (const auto & child : contents.children()) {
        std::vector<std::string> childPath = relative;
        childPath.push_back(child);
        size_t depth = childPath.size();

        if (maxDepth >= 0 && depth > (size_t)maxDepth + 1) {
            continue;
        }

        ListingEntry entry;
        entry.kind = ListingEntry::Folder;
        entry.path = childPath;
        entry.name = child;
        if (!visitor(entry)) {
            return false;
        }

        if (maxDepth < 0 || depth <= (size_t)maxDepth) {
            if (!visitFolder(childPath, tree, visitor)) {
                return false;
            }
        }
    }
    return true;
}

std::vector<ListingEntry> Listing::collect() {
    std::vector<ListingEntry> entries;
    each([&](const ListingEntry & entry) {
        entries.push_back(entry);
        return true;
    });
    return entries;
}

std::string Listing::format(const std::vector<ListingEntry> & entries, bool longFormat) {
    std::ostringstream out;

    if (!longFormat) {
        for (const auto & entry : entries) {
            out << entry.displayPath() << "\n";
        }
        return out.str();
    }

    std::vector<std::vector<std::string>> lines;
    lines.push_back({"chunks", "size", "date", "file"});
    for (const auto & entry : entries) {
        if (entry.kind == ListingEntry::Folder) {
            lines.push_back({"-", "-", "", entry.displayPath()});
            continue;
        }
        std::string chunks = std::to_string(entry.partsPresent) + "/" + std::to_string(entry.totalParts);
        std::string file = entry.displayPath();
        if (!entry.valid) {
            file += " (incomplete)";
        }
        lines.push_back({chunks, MailUtils::humanReadableSize(entry.size), MailUtils::localTimestampForTime(entry.date), file});
    }

    std::vector<size_t> widths(4, 0);
    for (const auto & line : lines) {
        for (size_t ii = 0; ii < line.size(); ii ++) {
            widths[ii] = std::max(widths[ii], line[ii].size());
        }
    }

    for (size_t ll = 0; ll < lines.size(); ll ++) {
        const auto & line = lines[ll];
        // counts and sizes right-aligned, except in the header
        out << (ll == 0 ? std::left : std::right) << std::setw((int)widths[0]) << line[0] << " ";
        out << std::setw((int)widths[1]) << line[1] << " ";
        out << std::left << std::setw((int)widths[2]) << line[2] << " ";
        out << line[3] << "\n";
    }
    return out.str();
}

ListingEngine::ListingEngine(MailTransport * transport, PathMapper mapper, DriveConfig config, TransferProgress * progress) :
    transport(transport), mapper(mapper), config(config), progress(progress), logger(spdlog::get("logger"))
{
}

Listing ListingEngine::list(const std::vector<std::string> & folder) {
    return list(folder, config.recurse, config.maxDepth);
}

Listing ListingEngine::list(const std::vector<std::string> & folder, bool recurse, int maxDepth) {
    // validates the path before anything is fetched
    mapper.encode(folder);
    return Listing(this, folder, recurse, maxDepth);
}

VirtualFolder ListingEngine::loadFolder(const std::vector<std::string> & folder) {
    VirtualFolder contents(folder);

    for (const auto & message : transport->listMessages(mapper.encode(folder))) {
        try {
            contents.addMessage(message);
        } catch (MalformedPartException & ex) {
            logger->debug("-- Skipping message {} in {}: {}", message.id, message.folderId, ex.what());
        }
    }
    return contents;
}

void ListingEngine::requireFolder(const std::vector<std::string> & folder) {
    if (!transport->folderExists(mapper.encode(folder))) {
        std::string path = PathMapper::format(folder);
        throw NotFoundException("folder-not-found", path, "The folder '" + path + "' does not exist.");
    }
}

std::shared_ptr<LogicalFile> ListingEngine::findFile(const std::vector<std::string> & folder, const std::string & name) {
    requireFolder(folder);

    std::shared_ptr<LogicalFile> file = loadFolder(folder).file(name);
    if (file == nullptr) {
        std::vector<std::string> segments = folder;
        segments.push_back(name);
        std::string path = PathMapper::format(segments);
        throw NotFoundException("file-not-found", path, "The file '" + path + "' does not exist.");
    }
    return file;
}

std::string ListingEngine::download(const std::vector<std::string> & folder, const std::string & name) {
    std::shared_ptr<LogicalFile> file = findFile(folder, name);

    // fail before transferring anything if parts are missing
    ChunkCodec::checkComplete(file->parts());

    logger->info("-- Downloading {} ({} part(s), {})", file->path(), file->totalParts(), MailUtils::humanReadableSize(file->size()));

    const std::vector<RemoteMessage> & messages = file->messages();
    const std::vector<PartMetadata> & metadata = file->parts();

    std::vector<size_t> order;
    for (size_t ii = 0; ii < messages.size(); ii ++) {
        order.push_back(ii);
    }
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return metadata[a].index < metadata[b].index;
    });

    std::vector<Part> parts;
    parts.reserve(order.size());
    for (size_t ii = 0; ii < order.size(); ii ++) {
        Part part;
        part.metadata = metadata[order[ii]];
        part.messageId = messages[order[ii]].id;
        part.payload = transport->fetchAttachment(messages[order[ii]]);
        logger->debug("-- Fetched part {} of {} (UID {}, {} bytes)", part.metadata.index + 1, part.metadata.totalParts, part.messageId, part.payload.size());
        parts.push_back(std::move(part));

        if (progress) {
            progress->partTransferred(name, (unsigned int)ii + 1, (unsigned int)order.size());
        }
    }

    return ChunkCodec::join(std::move(parts));
}

std::string ListingEngine::downloadTo(const std::vector<std::string> & folder, const std::string & name, const std::string & localPath) {
    std::string target = localPath.empty() ? name : localPath;

    struct stat st;
    if (stat(target.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        target = target + (target.back() == '/' ? "" : "/") + name;
    }
    if (stat(target.c_str(), &st) == 0) {
        throw DriveException("local-exists", "The local file '" + target + "' already exists.", target);
    }

    std::string bytes = download(folder, name);

    std::ofstream out(target, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.good()) {
        throw DriveException("local-write-failed", "Could not open '" + target + "' for writing.", target);
    }
    out.write(bytes.data(), (std::streamsize)bytes.size());
    out.close();
    if (out.fail()) {
        throw DriveException("local-write-failed", "Could not write '" + target + "'.", target);
    }

    logger->info("-- Wrote {} bytes to {}", bytes.size(), target);
    return target;
}

unsigned int ListingEngine::remove(const std::vector<std::string> & folder, const std::string & name) {
    std::shared_ptr<LogicalFile> file = findFile(folder, name);

    const std::vector<RemoteMessage> & messages = file->messages();
    unsigned int total = (unsigned int)messages.size();
    unsigned int removed = 0;

    logger->info("-- Removing {} ({} message(s))", file->path(), total);

    for (const auto & message : messages) {
        try {
            transport->deleteMessage(message);
        } catch (TransportException & ex) {
            logger->error("Removal of {} failed after {} of {} message(s): {}", file->path(), removed, total, ex.what());
            throw PartialTransferException("remove", file->path(), removed, total, 0, ex);
        }
        removed ++;
        if (progress) {
            progress->partTransferred(name, removed, total);
        }
    }
    return removed;
}

std::vector<std::vector<std::string>> ListingEngine::listFolders() {
    std::vector<std::vector<std::string>> results;

    for (const auto & folderId : transport->listFolders(mapper.encode({}))) {
        try {
            results.push_back(mapper.decode(folderId));
        } catch (InvalidSegmentException & ex) {
            logger->debug("-- Skipping folder {}: {}", folderId, ex.what());
        }
    }
    std::sort(results.begin(), results.end());
    return results;
}

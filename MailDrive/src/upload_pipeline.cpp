#include "maildrive/upload_pipeline.hpp"
#include "maildrive/chunk_codec.hpp"
#include "maildrive/drive_exception.hpp"
#include "maildrive/mail_utils.hpp"

#include <algorithm>
#include <fstream>
#include <dirent.h>
#include <sys/stat.h>

static std::string localBasename(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

nlohmann::json UploadReport::toJSON() const {
    return {
        {"filesUploaded", filesUploaded},
        {"partsSent", partsSent},
        {"bytesSent", bytesSent},
        {"foldersEnsured", foldersEnsured},
    };
}

UploadPipeline::UploadPipeline(MailTransport * transport, PathMapper mapper, DriveConfig config, TransferProgress * progress) :
    transport(transport), mapper(mapper), config(config), progress(progress), logger(spdlog::get("logger"))
{
}

UploadReport UploadPipeline::upload(const std::string & localPath, const std::vector<std::string> & destination) {
    struct stat st;
    if (stat(localPath.c_str(), &st) != 0) {
        throw NotFoundException("local-not-found", localPath, "The local path '" + localPath + "' does not exist.");
    }

    // validates the destination before anything is sent
    mapper.encode(destination);

    UploadReport report;

    if (S_ISREG(st.st_mode)) {
        uploadFile(localPath, localBasename(localPath), destination, config.startPart, report);

    } else if (S_ISDIR(st.st_mode)) {
        if (config.startPart != 0) {
            throw DriveException("bad-start-part", "--start-chunk can only be used when uploading a single file.");
        }

        // walk the whole tree first so a bad folder name fails the upload
        // before any part has been sent.
        std::vector<std::vector<std::string>> folders{destination};
        std::vector<PlannedFile> files;
        planDirectory(localPath, destination, folders, files);

        logger->info("-- Uploading {} file(s) in {} folder(s) from {}", files.size(), folders.size(), localPath);

        for (const auto & folder : folders) {
            report.foldersEnsured += ensureFolder(folder);
        }
        for (const auto & file : files) {
            try {
                uploadFile(file.localPath, file.name, file.folder, 0, report);
            } catch (PartialTransferException & ex) {
                logger->error("Upload of {} stopped after {} file(s) and {} part(s).", localPath, report.filesUploaded, report.partsSent);
                throw PartialTransferException(ex, localPath, file.localPath, file.folder.empty() ? "/" : PathMapper::format(file.folder), report.filesUploaded, report.partsSent);
            }
        }

    } else {
        throw DriveException("local-unsupported", "'" + localPath + "' is not a regular file or directory.", localPath);
    }

    logger->info("-- Upload complete: {}", report.toJSON().dump());
    return report;
}

void UploadPipeline::planDirectory(const std::string & localPath, const std::vector<std::string> & folder, std::vector<std::vector<std::string>> & folders, std::vector<PlannedFile> & files) {
    DIR * dir = opendir(localPath.c_str());
    if (dir == nullptr) {
        throw DriveException("local-read-failed", "Could not open the directory '" + localPath + "'.", localPath);
    }

    std::vector<std::string> names;
    while (struct dirent * entry = readdir(dir)) {
        std::string name = entry->d_name;
        if (name != "." && name != "..") {
            names.push_back(name);
        }
    }
    closedir(dir);
    std::sort(names.begin(), names.end());

    for (const auto & name : names) {
        std::string childPath = localPath + (localPath.back() == '/' ? "" : "/") + name;
        struct stat st;
        if (stat(childPath.c_str(), &st) != 0) {
            logger->warn("Skipping {}: it could not be read.", childPath);
            continue;
        }

        if (S_ISDIR(st.st_mode)) {
            std::vector<std::string> subfolder = folder;
            subfolder.push_back(name);
            mapper.validateSegment(name);
            folders.push_back(subfolder);
            planDirectory(childPath, subfolder, folders, files);

        } else if (S_ISREG(st.st_mode)) {
            files.push_back(PlannedFile{childPath, name, folder});

        } else {
            logger->warn("Skipping {}: it is not a regular file or directory.", childPath);
        }
    }
}

void UploadPipeline::uploadFile(const std::string & localPath, const std::string & name, const std::vector<std::string> & folder, unsigned int startPart, UploadReport & report) {
    struct stat st;
    if (stat(localPath.c_str(), &st) != 0) {
        throw NotFoundException("local-not-found", localPath, "The local path '" + localPath + "' does not exist.");
    }

    uint64_t size = (uint64_t)st.st_size;
    unsigned int total = ChunkCodec::partCount(size, config.maxPartSize);

    if (startPart >= total) {
        throw DriveException("bad-start-part", "Cannot start at part " + std::to_string(startPart) + ": '" + name + "' only has " + std::to_string(total) + " part(s).");
    }

    std::string folderId = mapper.encode(folder);
    report.foldersEnsured += ensureFolder(folder);

    std::ifstream in(localPath, std::ios::in | std::ios::binary);
    if (!in.good()) {
        throw DriveException("local-read-failed", "Could not open '" + localPath + "' for reading.", localPath);
    }

    logger->info("-- Uploading {} ({}) as {} part(s) to {}", localPath, MailUtils::humanReadableSize(size), total, folderId);

    std::string buffer;
    for (unsigned int index = startPart; index < total; index ++) {
        uint64_t offset = (uint64_t)index * config.maxPartSize;
        size_t length = (size_t)std::min<uint64_t>(config.maxPartSize, size - offset);

        buffer.resize(length);
        if (length > 0) {
            in.seekg((std::streamoff)offset);
            in.read(&buffer[0], (std::streamsize)length);
            if ((size_t)in.gcount() != length) {
                throw DriveException("local-read-failed", "Could not read part " + std::to_string(index + 1) + " of '" + localPath + "'.", localPath);
            }
        }

        std::string subject = ChunkCodec::encodeMetadata(name, index, total);
        try {
            uint32_t uid = transport->sendMessage(folderId, subject, buffer);
            logger->debug("-- Sent {} (UID {}, {} bytes)", subject, uid, length);
        } catch (TransportException & ex) {
            logger->error("Upload of {} failed at part {} of {}: {}", name, index + 1, total, ex.what());
            throw PartialTransferException("upload", name, index - startPart, total - startPart, startPart, ex);
        }

        report.partsSent ++;
        report.bytesSent += length;
        if (progress) {
            progress->partTransferred(name, index - startPart + 1, total - startPart);
        }
    }

    report.filesUploaded ++;
}

unsigned int UploadPipeline::ensureFolder(const std::vector<std::string> & folder) {
    // Some servers (Yahoo) refuse to create a folder whose parent is missing,
    // so every ancestor is created in turn, starting at the base folder.
    unsigned int count = 0;
    std::vector<std::string> prefix;

    for (size_t ii = 0; ii <= folder.size(); ii ++) {
        if (ii > 0) {
            prefix.push_back(folder[ii - 1]);
        }
        std::string folderId = mapper.encode(prefix);
        if (ensured.count(folderId)) {
            continue;
        }
        transport->createFolder(folderId);
        ensured.insert(folderId);
        count ++;
    }
    return count;
}

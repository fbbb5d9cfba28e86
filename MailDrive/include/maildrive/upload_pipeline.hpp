/** UploadPipeline [MailDrive]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef UploadPipeline_hpp
#define UploadPipeline_hpp

#include <stdio.h>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "maildrive/drive_config.hpp"
#include "maildrive/mail_transport.hpp"
#include "maildrive/path_mapper.hpp"
#include "maildrive/progress_collectors.hpp"

struct UploadReport {
    unsigned int filesUploaded = 0;
    unsigned int partsSent = 0;
    uint64_t bytesSent = 0;
    unsigned int foldersEnsured = 0;

    nlohmann::json toJSON() const;
};

/*
 Turns a local file or directory tree into part messages. Files are read one
 part at a time, so memory use is bounded by maxPartSize regardless of the
 file size. Parts are sent in index order and nothing is rolled back when the
 transport fails: the caller gets a PartialTransferException naming the next
 part to resume from.
*/
class UploadPipeline {
    MailTransport * transport;
    PathMapper mapper;
    DriveConfig config;
    TransferProgress * progress;
    std::shared_ptr<spdlog::logger> logger;

    // folders created (or found) during this invocation
    std::set<std::string> ensured;

    struct PlannedFile {
        std::string localPath;
        std::string name;
        std::vector<std::string> folder;
    };

    void planDirectory(const std::string & localPath, const std::vector<std::string> & folder, std::vector<std::vector<std::string>> & folders, std::vector<PlannedFile> & files);

public:
    UploadPipeline(MailTransport * transport, PathMapper mapper, DriveConfig config, TransferProgress * progress = nullptr);

    UploadReport upload(const std::string & localPath, const std::vector<std::string> & destination);

    void uploadFile(const std::string & localPath, const std::string & name, const std::vector<std::string> & folder, unsigned int startPart, UploadReport & report);

    unsigned int ensureFolder(const std::vector<std::string> & folder);
};

#endif /* UploadPipeline_hpp */

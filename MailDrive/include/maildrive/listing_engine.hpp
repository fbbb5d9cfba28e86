/** ListingEngine [MailDrive]
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

#ifndef ListingEngine_hpp
#define ListingEngine_hpp

#include <stdio.h>
#include <functional>
#include <map>
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
#include "maildrive/models/logical_file.hpp"
#include "maildrive/models/virtual_folder.hpp"

struct ListingEntry {
    enum Kind { File, Folder };

    Kind kind = File;
    // relative to the listed folder, ending with the entry's own name
    std::vector<std::string> path;
    std::string name;

    uint64_t size = 0;
    unsigned int partsPresent = 0;
    unsigned int totalParts = 0;
    bool valid = true;
    time_t date = 0;

    std::string displayPath() const;
    nlohmann::json toJSON() const;
};

class ListingEngine;

/*
 A lazy listing of one virtual folder. Nothing is fetched until each() runs,
 and each() can be run again to restart from the beginning. Folder contents
 are fetched one folder at a time, in the order entries are produced.
 A Listing borrows its ListingEngine: the engine must outlive every Listing
 it returns, including ones kept around to be run again.
*/
class Listing {
    ListingEngine * engine;
    std::vector<std::string> folder;
    bool recurse;
    int maxDepth;

    typedef std::map<std::vector<std::string>, std::set<std::string>> FolderTree;

    bool visitFolder(const std::vector<std::string> & relative, FolderTree & tree, const std::function<bool(const ListingEntry &)> & visitor);

public:
    Listing(ListingEngine * engine, std::vector<std::string> folder, bool recurse, int maxDepth);

    // The visitor returns false to stop early.
    void each(std::function<bool(const ListingEntry &)> visitor);
    std::vector<ListingEntry> collect();

    static std::string format(const std::vector<ListingEntry> & entries, bool longFormat);
};

class ListingEngine {
    friend class Listing;

    MailTransport * transport;
    PathMapper mapper;
    DriveConfig config;
    TransferProgress * progress;
    std::shared_ptr<spdlog::logger> logger;

    void requireFolder(const std::vector<std::string> & folder);
    std::shared_ptr<LogicalFile> findFile(const std::vector<std::string> & folder, const std::string & name);

public:
    ListingEngine(MailTransport * transport, PathMapper mapper, DriveConfig config, TransferProgress * progress = nullptr);

    Listing list(const std::vector<std::string> & folder);
    Listing list(const std::vector<std::string> & folder, bool recurse, int maxDepth);

    VirtualFolder loadFolder(const std::vector<std::string> & folder);

    std::string download(const std::vector<std::string> & folder, const std::string & name);
    std::string downloadTo(const std::vector<std::string> & folder, const std::string & name, const std::string & localPath);

    unsigned int remove(const std::vector<std::string> & folder, const std::string & name);

    std::vector<std::vector<std::string>> listFolders();
};

#endif /* ListingEngine_hpp */

/** LogicalFile [MailDrive]
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

#ifndef LogicalFile_hpp
#define LogicalFile_hpp

#include <stdio.h>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"

#include "maildrive/chunk_codec.hpp"
#include "maildrive/mail_transport.hpp"

/*
 A user file as it exists in a virtual folder: the group of messages whose
 subjects decode to the same name. The group may be incomplete or carry
 duplicate parts; complete() only reports, it never throws.
*/
class LogicalFile {
    std::string _name;
    std::vector<std::string> _folder;
    std::vector<RemoteMessage> _messages;
    std::vector<PartMetadata> _parts;

public:
    LogicalFile(std::string name, std::vector<std::string> folder);

    void addPart(const RemoteMessage & message, const PartMetadata & metadata);

    std::string name() const;
    std::vector<std::string> folder() const;
    std::string path() const;

    const std::vector<RemoteMessage> & messages() const;
    const std::vector<PartMetadata> & parts() const;

    unsigned int totalParts() const;
    unsigned int partsPresent() const;
    bool consistent() const;
    bool complete() const;

    uint64_t size() const;
    time_t lastModified() const;

    nlohmann::json toJSON() const;
};

#endif /* LogicalFile_hpp */

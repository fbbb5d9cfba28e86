/** VirtualFolder [MailDrive]
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

#ifndef VirtualFolder_hpp
#define VirtualFolder_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"

#include "maildrive/models/logical_file.hpp"

class VirtualFolder {
    std::vector<std::string> _path;
    std::map<std::string, std::shared_ptr<LogicalFile>> _files;
    std::set<std::string> _children;

public:
    VirtualFolder(std::vector<std::string> path);

    std::vector<std::string> path() const;
    std::string name() const;

    // Throws MalformedPartException for messages that aren't drive parts.
    std::shared_ptr<LogicalFile> addMessage(const RemoteMessage & message);
    void addChild(std::string name);

    std::vector<std::shared_ptr<LogicalFile>> files() const;
    std::shared_ptr<LogicalFile> file(std::string name) const;
    std::vector<std::string> children() const;

    nlohmann::json toJSON() const;
};

#endif /* VirtualFolder_hpp */

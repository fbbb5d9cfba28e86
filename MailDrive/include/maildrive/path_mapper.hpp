/** PathMapper [MailDrive]
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

#ifndef PathMapper_hpp
#define PathMapper_hpp

#include <stdio.h>
#include <string>
#include <vector>

/*
 Maps a virtual folder path (a list of segments) onto a transport folder
 identifier below the configured base folder, and back. The transport's own
 hierarchy delimiter is used as the reserved separator, so segments may not
 contain it.

 encode({"photos", "2019"}) with base "maildrive" and delimiter '/'
   => "maildrive/photos/2019"
 encode({}) => "maildrive"
*/
class PathMapper {
    std::string _baseFolder;
    char _delimiter;

public:
    PathMapper(std::string baseFolder, char delimiter);

    std::string baseFolder() const;
    char delimiter() const;

    std::string encode(const std::vector<std::string> & segments) const;
    std::vector<std::string> decode(const std::string & identifier) const;

    bool contains(const std::string & identifier) const;
    size_t depth(const std::string & identifier) const;

    void validateSegment(const std::string & segment) const;

    // User-facing remote paths always use "/", whatever the server delimiter.
    static std::vector<std::string> parse(const std::string & remotePath);
    static std::string format(const std::vector<std::string> & segments);
};

#endif /* PathMapper_hpp */

/** MailTransport [MailDrive]
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

#ifndef MailTransport_hpp
#define MailTransport_hpp

#include <stdio.h>
#include <stdint.h>
#include <time.h>
#include <string>
#include <vector>

struct RemoteMessage {
    uint32_t id = 0;
    std::string folderId;
    std::string subject;
    uint64_t attachmentSize = 0;
    time_t date = 0;
};

/*
 The message store the drive is built on. Folder identifiers are full,
 UTF-8 folder paths using the delimiter returned by folderDelimiter().
 Every method throws TransportException when the server fails; none of
 them retry on their own.
*/
class MailTransport {
public:
    virtual ~MailTransport() {}

    virtual char folderDelimiter() = 0;

    virtual std::vector<RemoteMessage> listMessages(const std::string & folderId) = 0;
    virtual std::string fetchAttachment(const RemoteMessage & message) = 0;
    virtual uint32_t sendMessage(const std::string & folderId, const std::string & subject, const std::string & attachment) = 0;
    virtual void deleteMessage(const RemoteMessage & message) = 0;

    // Creating a folder that already exists is a no-op.
    virtual void createFolder(const std::string & folderId) = 0;

    // All folders below parentFolderId, at any depth, excluding the parent itself.
    virtual std::vector<std::string> listFolders(const std::string & parentFolderId) = 0;
    virtual bool folderExists(const std::string & folderId) = 0;
};

#endif /* MailTransport_hpp */

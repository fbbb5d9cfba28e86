/** IMAPMailTransport [MailDrive]
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

#ifndef IMAPMailTransport_hpp
#define IMAPMailTransport_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>
#include "MailCore/MailCore.h"
#include "spdlog/spdlog.h"

#include "maildrive/mail_transport.hpp"
#include "maildrive/models/account.hpp"

class SpdlogConnectionLogger;

/*
 MailTransport over a single IMAP connection. The session is not thread-safe,
 so one transport must only be driven from one thread.
*/
class IMAPMailTransport : public MailTransport {
    mailcore::IMAPSession session;
    std::shared_ptr<Account> account;
    std::shared_ptr<spdlog::logger> logger;
    std::unique_ptr<SpdlogConnectionLogger> connectionLogger;

    std::string trashFolder;
    char delimiter = 0;

    void connect();
    std::vector<std::string> allFolderPaths();

public:
    IMAPMailTransport(std::shared_ptr<Account> account, std::string trashFolder = "", bool verbose = false);
    ~IMAPMailTransport();

    std::string namespacePrefix();

    char folderDelimiter();

    std::vector<RemoteMessage> listMessages(const std::string & folderId);
    std::string fetchAttachment(const RemoteMessage & message);
    uint32_t sendMessage(const std::string & folderId, const std::string & subject, const std::string & attachment);
    void deleteMessage(const RemoteMessage & message);

    void createFolder(const std::string & folderId);
    std::vector<std::string> listFolders(const std::string & parentFolderId);
    bool folderExists(const std::string & folderId);
};

#endif /* IMAPMailTransport_hpp */

/** Account [MailDrive]
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

#ifndef Account_hpp
#define Account_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include "nlohmann/json.hpp"

/*
 The mailbox the drive lives in, loaded from a credentials JSON file:

 {
   "email_address": "someone@yahoo.com",
   "settings": {
     "imap_password": "app-password",
     "imap_host": "imap.mail.yahoo.com",   (optional)
     "imap_port": 993,                     (optional)
     "imap_username": "someone@yahoo.com", (optional)
     "imap_security": "SSL",               (optional: SSL, STARTTLS, none)
     "imap_allow_insecure_ssl": false      (optional)
   }
 }
*/
class Account {
    nlohmann::json _data;

public:
    Account(nlohmann::json json);

    static std::shared_ptr<Account> fromFile(std::string path);

    std::string valid();

    std::string emailAddress();

    unsigned int IMAPPort();
    std::string IMAPHost();
    std::string IMAPUsername();
    std::string IMAPPassword();
    std::string IMAPSecurity();
    bool IMAPAllowInsecureSSL();

    nlohmann::json toJSON();
};

#endif /* Account_hpp */

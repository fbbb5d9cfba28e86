/** MailUtils [MailDrive]
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

#ifndef MailUtils_hpp
#define MailUtils_hpp

#include <memory>
#include <string>
#include <vector>

#include <stdio.h>
#include "MailCore/MailCore.h"

class Account;

class MailUtils {

public:
    static std::string getEnvUTF8(std::string key);

    static std::string localTimestampForTime(time_t time);
    static std::string humanReadableSize(uint64_t bytes);

    static std::string namespacePrefixOrBlank(mailcore::IMAPSession * session);
    static std::string pathWithNamespacePrefix(std::string path, std::string prefix, char delimiter);

    static void enableVerboseLogging();
    static void configureSessionForAccount(mailcore::IMAPSession & session, std::shared_ptr<Account> account);
};

#endif /* MailUtils_hpp */

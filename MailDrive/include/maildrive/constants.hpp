/** Constants [MailDrive]
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

#ifndef constants_hpp
#define constants_hpp

#include <map>
#include <string>
#include "MailCore/MailCore.h"

#define AS_MCSTR(X)         mailcore::String::uniquedStringWithUTF8Characters(X.c_str())

#define MAILDRIVE_DEFAULT_FOLDER        "maildrive"
#define MAILDRIVE_USER_AGENT            "MailDrive"

// Yahoo rejects attachments above ~29.1 MB. The 100 KB of headroom leaves
// room for the headers and reasonably long file names.
#define MAILDRIVE_DEFAULT_PART_SIZE     (29 * 1024 * 1024)

#define MAILDRIVE_DEFAULT_IMAP_HOST     "imap.mail.yahoo.com"
#define MAILDRIVE_DEFAULT_IMAP_PORT     993
#define MAILDRIVE_DEFAULT_IMAP_SECURITY "SSL"

#define MAILDRIVE_CREDENTIALS_FILE      "credentials.json"

static std::map<mailcore::ErrorCode, std::string> ErrorCodeToTypeMap = {
    {mailcore::ErrorNone, "ErrorNone"}, // 0
    {mailcore::ErrorConnection, "ErrorConnection"},
    {mailcore::ErrorTLSNotAvailable, "ErrorTLSNotAvailable"},
    {mailcore::ErrorParse, "ErrorParse"},
    {mailcore::ErrorCertificate, "ErrorCertificate"},
    {mailcore::ErrorAuthentication, "ErrorAuthentication"},
    {mailcore::ErrorGmailIMAPNotEnabled, "ErrorGmailIMAPNotEnabled"},
    {mailcore::ErrorGmailExceededBandwidthLimit, "ErrorGmailExceededBandwidthLimit"},
    {mailcore::ErrorGmailTooManySimultaneousConnections, "ErrorGmailTooManySimultaneousConnections"},
    {mailcore::ErrorMobileMeMoved, "ErrorMobileMeMoved"},
    {mailcore::ErrorYahooUnavailable, "ErrorYahooUnavailable"}, // 10
    {mailcore::ErrorNonExistantFolder, "ErrorNonExistantFolder"},
    {mailcore::ErrorRename, "ErrorRename"},
    {mailcore::ErrorDelete, "ErrorDelete"},
    {mailcore::ErrorCreate, "ErrorCreate"},
    {mailcore::ErrorSubscribe, "ErrorSubscribe"},
    {mailcore::ErrorAppend, "ErrorAppend"},
    {mailcore::ErrorCopy, "ErrorCopy"},
    {mailcore::ErrorExpunge, "ErrorExpunge"},
    {mailcore::ErrorFetch, "ErrorFetch"},
    {mailcore::ErrorIdle, "ErrorIdle"}, // 20
    {mailcore::ErrorIdentity, "ErrorIdentity"},
    {mailcore::ErrorNamespace, "ErrorNamespace"},
    {mailcore::ErrorStore, "ErrorStore"},
    {mailcore::ErrorCapability, "ErrorCapability"},
    {mailcore::ErrorStartTLSNotAvailable, "ErrorStartTLSNotAvailable"},
    {mailcore::ErrorStorageLimit, "ErrorStorageLimit"},
    {mailcore::ErrorFetchMessageList, "ErrorFetchMessageList"},
    {mailcore::ErrorDeleteMessage, "ErrorDeleteMessage"},
    {mailcore::ErrorFile, "ErrorFile"},
    {mailcore::ErrorCompression, "ErrorCompression"},
    {mailcore::ErrorNoop, "ErrorNoop"},
    {mailcore::ErrorServerDate, "ErrorServerDate"},
    {mailcore::ErrorCustomCommand, "ErrorCustomCommand"},
    {mailcore::ErrorInvalidAccount, "ErrorInvalidAccount"},
    {mailcore::ErrorGmailApplicationSpecificPasswordRequired, "ErrorGmailApplicationSpecificPasswordRequired"},
    {mailcore::ErrorOutlookLoginViaWebBrowser, "ErrorOutlookLoginViaWebBrowser"},
    {mailcore::ErrorNeedsConnectToWebmail, "ErrorNeedsConnectToWebmail"},
    {mailcore::ErrorNoValidServerFound, "ErrorNoValidServerFound"},
    {mailcore::ErrorAuthenticationRequired, "ErrorAuthenticationRequired"},
};

#endif /* constants_hpp */

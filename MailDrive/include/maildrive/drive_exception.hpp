/** DriveException [MailDrive]
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

#ifndef DriveException_hpp
#define DriveException_hpp

#include <stdio.h>
#include <string>
#include <vector>
#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"
#include "maildrive/generic_exception.hpp"


class DriveException : public GenericException {
protected:
    bool retryable = false;
    std::string message;

public:
    DriveException(std::string key, std::string message, std::string di = "", bool retryable = false);
    std::string key;
    std::string debuginfo;

    const char * what() const noexcept override;
    bool isRetryable();
    nlohmann::json toJSON() override;
};

/* A virtual folder segment that can't be mapped to a transport folder. Raised
 before any network call is made. */
class InvalidSegmentException : public DriveException {
public:
    InvalidSegmentException(std::string segment, std::string reason);
    InvalidSegmentException(std::string key, std::string segment, std::string reason);
    std::string segment;
};

/* A message whose subject doesn't decode to part metadata. Listing treats
 these as foreign messages and skips them. */
class MalformedPartException : public DriveException {
public:
    MalformedPartException(std::string subject, std::string reason);
    std::string subject;
};

class IncompletePartSetException : public DriveException {
public:
    IncompletePartSetException(std::string name, unsigned int expected, unsigned int observed, std::vector<unsigned int> missing);
    IncompletePartSetException(std::string name, std::string key, std::string message);

    std::string name;
    unsigned int expected = 0;
    unsigned int observed = 0;
    std::vector<unsigned int> missing;

    nlohmann::json toJSON() override;
};

class DuplicatePartException : public DriveException {
public:
    DuplicatePartException(std::string name, unsigned int index, std::vector<uint32_t> messageIds);

    std::string name;
    unsigned int index;
    std::vector<uint32_t> messageIds;

    nlohmann::json toJSON() override;
};

class NotFoundException : public DriveException {
public:
    NotFoundException(std::string key, std::string target, std::string message);
    std::string target;
};

class TransportException : public DriveException {
protected:
    bool offline = false;

public:
    TransportException(std::string key, std::string di, bool retryable);
    TransportException(mailcore::ErrorCode c, std::string di);
    bool isOffline();
};

/* The transport failed partway through a multi-message operation. `succeeded`
 messages of `name` were written (or deleted) before the failure and are not
 rolled back. When a directory upload fails, the second constructor wraps the
 failure of the file in progress with the totals for the whole directory. */
class PartialTransferException : public TransportException {
public:
    PartialTransferException(std::string operation, std::string name, unsigned int succeeded, unsigned int total, unsigned int firstIndex, TransportException & cause);
    PartialTransferException(PartialTransferException & fileFailure, std::string directory, std::string localPath, std::string remoteFolder, unsigned int filesCompleted, unsigned int partsSentTotal);

    std::string operation;
    std::string name;
    unsigned int succeeded;
    unsigned int total;
    unsigned int firstIndex;
    std::string causeKey;
    std::string causeMessage;

    // totals across every file of the operation, including `succeeded`
    unsigned int filesCompleted = 0;
    unsigned int partsSentTotal = 0;
    // set for directory uploads only
    std::string directory;
    std::string localPath;

    nlohmann::json toJSON() override;
};

#endif /* DriveException_hpp */

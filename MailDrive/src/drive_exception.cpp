#include "maildrive/drive_exception.hpp"
#include "maildrive/constants.hpp"

#include <sstream>

DriveException::DriveException(std::string key, std::string message, std::string di, bool retryable) :
    GenericException(), retryable(retryable), message(message), key(key), debuginfo(di)
{
}

const char * DriveException::what() const noexcept {
    return message.c_str();
}

bool DriveException::isRetryable() {
    return retryable;
}

nlohmann::json DriveException::toJSON() {
    return {
        {"what", what()},
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
    };
}

InvalidSegmentException::InvalidSegmentException(std::string segment, std::string reason) :
    InvalidSegmentException("invalid-segment", segment, reason)
{
}

InvalidSegmentException::InvalidSegmentException(std::string key, std::string segment, std::string reason) :
    DriveException(key, "Invalid folder name '" + segment + "': " + reason + ".", reason, false), segment(segment)
{
}

MalformedPartException::MalformedPartException(std::string subject, std::string reason) :
    DriveException("malformed-part", "Could not decode part metadata from '" + subject + "': " + reason + ".", reason, false), subject(subject)
{
}

IncompletePartSetException::IncompletePartSetException(std::string name, unsigned int expected, unsigned int observed, std::vector<unsigned int> missing) :
    DriveException("incomplete-part-set", "", "", false), name(name), expected(expected), observed(observed), missing(missing)
{
    std::ostringstream msg;
    msg << "The file '" << name << "' is incomplete: " << observed << " of " << expected << " parts are present";
    if (missing.size() > 0) {
        msg << ", missing part(s)";
        for (size_t ii = 0; ii < missing.size() && ii < 10; ii ++) {
            msg << (ii == 0 ? " " : ", ") << missing[ii] + 1;
        }
        if (missing.size() > 10) {
            msg << " and " << missing.size() - 10 << " more";
        }
    }
    msg << ".";
    message = msg.str();
}

IncompletePartSetException::IncompletePartSetException(std::string name, std::string key, std::string message) :
    DriveException(key, message, "", false), name(name)
{
}

nlohmann::json IncompletePartSetException::toJSON() {
    nlohmann::json j = DriveException::toJSON();
    j["name"] = name;
    j["expected"] = expected;
    j["observed"] = observed;
    j["missing"] = missing;
    return j;
}

DuplicatePartException::DuplicatePartException(std::string name, unsigned int index, std::vector<uint32_t> messageIds) :
    DriveException("duplicate-part", "", "", false), name(name), index(index), messageIds(messageIds)
{
    std::ostringstream msg;
    msg << "The file '" << name << "' has " << messageIds.size() << " conflicting copies of part " << index + 1 << " (UIDs";
    for (size_t ii = 0; ii < messageIds.size(); ii ++) {
        msg << (ii == 0 ? " " : ", ") << messageIds[ii];
    }
    msg << ").";
    message = msg.str();
}

nlohmann::json DuplicatePartException::toJSON() {
    nlohmann::json j = DriveException::toJSON();
    j["name"] = name;
    j["index"] = index;
    j["messageIds"] = messageIds;
    return j;
}

NotFoundException::NotFoundException(std::string key, std::string target, std::string message) :
    DriveException(key, message, target, false), target(target)
{
}

TransportException::TransportException(std::string key, std::string di, bool retryable) :
    DriveException(key, key + " (" + di + ")", di, retryable)
{
}

TransportException::TransportException(mailcore::ErrorCode c, std::string di) :
    DriveException("", "", di, false)
{
    key = ErrorCodeToTypeMap.count(c) ? ErrorCodeToTypeMap[c] : "ErrorUnknown";
    message = "The mail server returned " + key + " during " + di + ".";

    if (c == mailcore::ErrorConnection) {
        retryable = true;
        offline = true;
    }
    if (c == mailcore::ErrorParse) {
        // Parse errors are usually caused by the connection dropping mid-response.
        retryable = true;
    }
    if (c == mailcore::ErrorFetch || c == mailcore::ErrorYahooUnavailable || c == mailcore::ErrorGmailTooManySimultaneousConnections) {
        retryable = true;
    }
}

bool TransportException::isOffline() {
    return offline;
}

PartialTransferException::PartialTransferException(std::string operation, std::string name, unsigned int succeeded, unsigned int total, unsigned int firstIndex, TransportException & cause) :
    TransportException("partial-" + operation, cause.debuginfo, cause.isRetryable()),
    operation(operation), name(name), succeeded(succeeded), total(total), firstIndex(firstIndex), causeKey(cause.key), causeMessage(cause.what()),
    partsSentTotal(succeeded)
{
    offline = cause.isOffline();

    std::ostringstream msg;
    msg << "Could only " << operation << " " << succeeded << " of " << total << " part(s) of '" << name
        << "' before the mail server failed (" << cause.what() << ")";
    if (operation == "upload") {
        msg << ". Resume with --start-chunk " << firstIndex + succeeded << " or remove the partial file";
    } else {
        msg << ". The remaining parts must be removed manually";
    }
    msg << ".";
    message = msg.str();
}

PartialTransferException::PartialTransferException(PartialTransferException & fileFailure, std::string directory, std::string localPath, std::string remoteFolder, unsigned int filesCompleted, unsigned int partsSentTotal) :
    TransportException(fileFailure.key, fileFailure.debuginfo, fileFailure.isRetryable()),
    operation(fileFailure.operation), name(fileFailure.name), succeeded(fileFailure.succeeded), total(fileFailure.total), firstIndex(fileFailure.firstIndex),
    causeKey(fileFailure.causeKey), causeMessage(fileFailure.causeMessage),
    filesCompleted(filesCompleted), partsSentTotal(partsSentTotal), directory(directory), localPath(localPath)
{
    offline = fileFailure.isOffline();

    // a directory can't be resumed as a whole, only the file that failed can
    std::ostringstream msg;
    msg << "Uploaded " << filesCompleted << " file(s) and " << partsSentTotal << " part(s) from '" << directory
        << "' before the mail server failed on '" << name << "' after " << succeeded << " of " << total
        << " part(s) (" << causeMessage << "). To finish, upload '" << localPath << "' to '" << remoteFolder
        << "' with --start-chunk " << firstIndex + succeeded << ", then upload the files that follow it in '" << directory << "'.";
    message = msg.str();
}

nlohmann::json PartialTransferException::toJSON() {
    nlohmann::json j = DriveException::toJSON();
    j["operation"] = operation;
    j["name"] = name;
    j["succeeded"] = succeeded;
    j["total"] = total;
    j["firstIndex"] = firstIndex;
    j["cause"] = causeKey;
    j["filesCompleted"] = filesCompleted;
    j["partsSentTotal"] = partsSentTotal;
    if (!directory.empty()) {
        j["directory"] = directory;
        j["localPath"] = localPath;
    }
    return j;
}

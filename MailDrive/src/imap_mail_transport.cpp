#include "maildrive/imap_mail_transport.hpp"
#include "maildrive/constants.hpp"
#include "maildrive/drive_exception.hpp"
#include "maildrive/mail_utils.hpp"
#include "maildrive/progress_collectors.hpp"

#include <algorithm>

using namespace mailcore;

class SpdlogConnectionLogger : public ConnectionLogger {
public:
    void log(void * sender, ConnectionLogType logType, Data * buffer) {
        if (buffer == nullptr) {
            return;
        }
        // never write credentials or attachment payloads to the log
        if (logType == ConnectionLogTypeSentPrivate) {
            spdlog::get("logger")->debug("IMAP >> (private)");
            return;
        }
        std::string text(buffer->bytes(), std::min(buffer->length(), 512u));
        spdlog::get("logger")->debug("IMAP {} {}", logType == ConnectionLogTypeReceived ? "<<" : ">>", text);
    }
};

static String * folderPath(const std::string & folderId) {
    return AS_MCSTR(folderId)->mUTF7EncodedString();
}

IMAPMailTransport::IMAPMailTransport(std::shared_ptr<Account> account, std::string trashFolder, bool verbose) :
    account(account), logger(spdlog::get("logger")), trashFolder(trashFolder)
{
    MailUtils::configureSessionForAccount(session, account);
    if (verbose) {
        connectionLogger.reset(new SpdlogConnectionLogger());
        session.setConnectionLogger(connectionLogger.get());
    }
}

IMAPMailTransport::~IMAPMailTransport() {
    session.setConnectionLogger(nullptr);
    session.disconnect();
}

void IMAPMailTransport::connect() {
    ErrorCode err = ErrorCode::ErrorNone;
    session.connectIfNeeded(&err);
    if (err != ErrorCode::ErrorNone) {
        throw TransportException(err, "connectIfNeeded");
    }
    session.loginIfNeeded(&err);
    if (err != ErrorCode::ErrorNone) {
        throw TransportException(err, "loginIfNeeded");
    }
}

std::string IMAPMailTransport::namespacePrefix() {
    connect();
    return MailUtils::namespacePrefixOrBlank(&session);
}

std::vector<std::string> IMAPMailTransport::allFolderPaths() {
    AutoreleasePool pool;
    connect();

    ErrorCode err = ErrorCode::ErrorNone;
    Array * folders = session.fetchAllFolders(&err);
    if (err != ErrorNone) {
        throw TransportException(err, "fetchAllFolders");
    }

    std::vector<std::string> paths;
    for (unsigned int ii = 0; ii < folders->count(); ii ++) {
        IMAPFolder * folder = (IMAPFolder *)folders->objectAtIndex(ii);
        if (delimiter == 0 && folder->delimiter() != 0) {
            delimiter = folder->delimiter();
        }
        paths.push_back(folder->path()->mUTF7DecodedString()->UTF8Characters());
    }
    return paths;
}

char IMAPMailTransport::folderDelimiter() {
    if (delimiter != 0) {
        return delimiter;
    }
    connect();
    IMAPNamespace * ns = session.defaultNamespace();
    if (ns != nullptr && ns->mainDelimiter() != 0) {
        delimiter = ns->mainDelimiter();
    } else {
        allFolderPaths();
    }
    if (delimiter == 0) {
        delimiter = '/';
    }
    return delimiter;
}

std::vector<RemoteMessage> IMAPMailTransport::listMessages(const std::string & folderId) {
    AutoreleasePool pool;
    connect();

    IMAPProgress cb;
    ErrorCode err = ErrorCode::ErrorNone;
    IndexSet * uids = IndexSet::indexSetWithRange(RangeMake(1, UINT64_MAX));
    IMAPMessagesRequestKind kind = IMAPMessagesRequestKind(IMAPMessagesRequestKindHeaders | IMAPMessagesRequestKindStructure | IMAPMessagesRequestKindInternalDate);

    Array * remote = session.fetchMessagesByUID(folderPath(folderId), kind, uids, &cb, &err);
    if (err != ErrorNone) {
        throw TransportException(err, "listMessages - fetchMessagesByUID");
    }

    std::vector<RemoteMessage> results;
    results.reserve(remote->count());

    for (unsigned int ii = 0; ii < remote->count(); ii ++) {
        IMAPMessage * msg = (IMAPMessage *)remote->objectAtIndex(ii);
        RemoteMessage message;
        message.id = msg->uid();
        message.folderId = folderId;
        message.subject = msg->header()->subject() ? msg->header()->subject()->UTF8Characters() : "";
        message.date = msg->header()->receivedDate() > 0 ? msg->header()->receivedDate() : msg->header()->date();

        Array * attachments = msg->attachments();
        if (attachments != nullptr && attachments->count() > 0) {
            message.attachmentSize = ((IMAPPart *)attachments->objectAtIndex(0))->decodedSize();
        } else {
            message.attachmentSize = 0;
        }
        results.push_back(message);
    }

    logger->debug("-- Listed {} messages in {}", results.size(), folderId);
    return results;
}

std::string IMAPMailTransport::fetchAttachment(const RemoteMessage & message) {
    AutoreleasePool pool;
    connect();

    IMAPProgress cb;
    ErrorCode err = ErrorCode::ErrorNone;

    Data * data = session.fetchMessageByUID(folderPath(message.folderId), message.id, &cb, &err);
    if (err != ErrorNone) {
        throw TransportException(err, "fetchAttachment - fetchMessageByUID");
    }

    MessageParser * messageParser = MessageParser::messageParserWithData(data);
    Array * attachments = messageParser->attachments();
    if (attachments == nullptr || attachments->count() == 0) {
        throw TransportException("missing-attachment", "fetchAttachment - UID " + std::to_string(message.id) + " in " + message.folderId, false);
    }

    Attachment * attachment = (Attachment *)attachments->objectAtIndex(0);
    Data * bytes = attachment->data();
    if (bytes == nullptr) {
        return "";
    }
    return std::string(bytes->bytes(), bytes->length());
}

uint32_t IMAPMailTransport::sendMessage(const std::string & folderId, const std::string & subject, const std::string & attachment) {
    AutoreleasePool pool;
    connect();

    // build the MIME message
    MessageBuilder builder;
    Address * me = Address::addressWithMailbox(AS_MCSTR(account->emailAddress()));
    builder.header()->setSubject(AS_MCSTR(subject));
    builder.header()->setUserAgent(MCSTR(MAILDRIVE_USER_AGENT));
    builder.header()->setDate(time(0));
    builder.header()->setFrom(me);
    builder.header()->setTo(Array::arrayWithObject(me));
    builder.setTextBody(MCSTR(""));

    Data * payload = Data::dataWithBytes(attachment.data(), (unsigned int)attachment.size());
    Attachment * a = Attachment::attachmentWithData(AS_MCSTR(subject), payload);
    a->setMimeType(MCSTR("application/octet-stream"));
    builder.addAttachment(a);

    IMAPProgress cb;
    ErrorCode err = ErrorCode::ErrorNone;
    uint32_t createdUID = 0;

    session.appendMessage(folderPath(folderId), builder.data(), MessageFlagSeen, &cb, &createdUID, &err);
    if (err != ErrorNone) {
        throw TransportException(err, "sendMessage - appendMessage");
    }
    return createdUID;
}

void IMAPMailTransport::deleteMessage(const RemoteMessage & message) {
    AutoreleasePool pool;
    connect();

    ErrorCode err = ErrorCode::ErrorNone;
    String * path = folderPath(message.folderId);
    IndexSet * uids = IndexSet::indexSetWithIndex(message.id);

    if (trashFolder != "") {
        HashMap * uidMapping = nullptr;
        session.copyMessages(path, uids, folderPath(trashFolder), &uidMapping, &err);
        if (err != ErrorNone) {
            throw TransportException(err, "deleteMessage - copyMessages");
        }
    }

    session.storeFlagsByUID(path, uids, IMAPStoreFlagsRequestKindAdd, MessageFlagDeleted, &err);
    if (err != ErrorNone) {
        throw TransportException(err, "deleteMessage - storeFlagsByUID");
    }

    session.expungeUIDs(path, uids, &err);
    if (err != ErrorNone) {
        logger->info("-- deleteMessage Expunge (UIDs) failed (error: {})", ErrorCodeToTypeMap[err]);
        logger->info("-- deleteMessage Expunging (Basic) from {}", message.folderId);
        err = ErrorNone;
        session.expunge(path, &err);
    }
    if (err != ErrorNone) {
        throw TransportException(err, "deleteMessage - expunge");
    }
}

void IMAPMailTransport::createFolder(const std::string & folderId) {
    if (folderExists(folderId)) {
        return;
    }

    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    session.createFolder(folderPath(folderId), &err);
    if (err != ErrorNone) {
        logger->error("Could not create folder: {}. {}", folderId, ErrorCodeToTypeMap[err]);
        throw TransportException(err, "createFolder");
    }
    logger->info("-- Created folder {}", folderId);
}

std::vector<std::string> IMAPMailTransport::listFolders(const std::string & parentFolderId) {
    std::vector<std::string> paths = allFolderPaths();
    char d = folderDelimiter();

    std::vector<std::string> results;
    for (const auto & path : paths) {
        if (path.size() > parentFolderId.size() + 1 &&
            path.compare(0, parentFolderId.size(), parentFolderId) == 0 &&
            path[parentFolderId.size()] == d) {
            results.push_back(path);
        }
    }
    std::sort(results.begin(), results.end());
    return results;
}

bool IMAPMailTransport::folderExists(const std::string & folderId) {
    std::vector<std::string> paths = allFolderPaths();
    return std::find(paths.begin(), paths.end(), folderId) != paths.end();
}

#ifndef INMEMORYMAILTRANSPORT_HPP
#define INMEMORYMAILTRANSPORT_HPP

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "maildrive/mail_transport.hpp"
#include "maildrive/drive_exception.hpp"

// A mailbox kept in memory. Like Yahoo, it refuses to create a folder whose
// parent doesn't exist yet.
class InMemoryMailTransport : public MailTransport {
public:
    char delimiter = '/';
    uint32_t nextUID = 1;
    time_t nextDate = 1500000000;

    std::map<std::string, std::vector<RemoteMessage>> folders;
    std::map<std::pair<std::string, uint32_t>, std::string> payloads;
    std::vector<std::string> createdFolders;

    char folderDelimiter() override {
        return delimiter;
    }

    std::vector<RemoteMessage> listMessages(const std::string & folderId) override {
        if (!folders.count(folderId)) {
            throw TransportException("ErrorNonExistantFolder", "listMessages " + folderId, false);
        }
        return folders[folderId];
    }

    std::string fetchAttachment(const RemoteMessage & message) override {
        auto it = payloads.find(std::make_pair(message.folderId, message.id));
        if (it == payloads.end()) {
            throw TransportException("ErrorFetch", "fetchAttachment " + std::to_string(message.id), true);
        }
        return it->second;
    }

    uint32_t sendMessage(const std::string & folderId, const std::string & subject, const std::string & attachment) override {
        if (!folders.count(folderId)) {
            throw TransportException("ErrorNonExistantFolder", "sendMessage " + folderId, false);
        }
        RemoteMessage message;
        message.id = nextUID++;
        message.folderId = folderId;
        message.subject = subject;
        message.attachmentSize = attachment.size();
        message.date = nextDate++;
        folders[folderId].push_back(message);
        payloads[std::make_pair(folderId, message.id)] = attachment;
        return message.id;
    }

    void deleteMessage(const RemoteMessage & message) override {
        auto & messages = folders[message.folderId];
        messages.erase(std::remove_if(messages.begin(), messages.end(), [&](const RemoteMessage & m) {
            return m.id == message.id;
        }), messages.end());
        payloads.erase(std::make_pair(message.folderId, message.id));
    }

    void createFolder(const std::string & folderId) override {
        if (folders.count(folderId)) {
            return;
        }
        size_t split = folderId.rfind(delimiter);
        if (split != std::string::npos && !folders.count(folderId.substr(0, split))) {
            throw TransportException("ErrorCreate", "createFolder " + folderId, false);
        }
        folders[folderId];
        createdFolders.push_back(folderId);
    }

    std::vector<std::string> listFolders(const std::string & parentFolderId) override {
        std::vector<std::string> results;
        std::string prefix = parentFolderId + delimiter;
        for (const auto & pair : folders) {
            if (pair.first.compare(0, prefix.size(), prefix) == 0) {
                results.push_back(pair.first);
            }
        }
        return results;
    }

    bool folderExists(const std::string & folderId) override {
        return folders.count(folderId) > 0;
    }

    // Seeds a message directly, creating the folder (but not its ancestors).
    uint32_t addMessage(const std::string & folderId, const std::string & subject, const std::string & payload) {
        folders[folderId];
        return sendMessage(folderId, subject, payload);
    }

    std::vector<std::string> subjectsIn(const std::string & folderId) {
        std::vector<std::string> subjects;
        for (const auto & message : folders[folderId]) {
            subjects.push_back(message.subject);
        }
        return subjects;
    }
};

#endif // INMEMORYMAILTRANSPORT_HPP

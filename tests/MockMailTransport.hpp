#ifndef MOCKMAILTRANSPORT_HPP
#define MOCKMAILTRANSPORT_HPP

#include <gmock/gmock.h>
#include <string>
#include <vector>

#include "maildrive/mail_transport.hpp"
#include "InMemoryMailTransport.hpp"

class MockMailTransport : public MailTransport {
public:
    InMemoryMailTransport fake;

    MOCK_METHOD(char, folderDelimiter, (), (override));

    MOCK_METHOD(std::vector<RemoteMessage>, listMessages, (const std::string & folderId), (override));

    MOCK_METHOD(std::string, fetchAttachment, (const RemoteMessage & message), (override));

    MOCK_METHOD(uint32_t, sendMessage, (const std::string & folderId, const std::string & subject, const std::string & attachment), (override));

    MOCK_METHOD(void, deleteMessage, (const RemoteMessage & message), (override));

    MOCK_METHOD(void, createFolder, (const std::string & folderId), (override));

    MOCK_METHOD(std::vector<std::string>, listFolders, (const std::string & parentFolderId), (override));

    MOCK_METHOD(bool, folderExists, (const std::string & folderId), (override));

    // Calls without an explicit expectation fall through to the in-memory mailbox.
    void delegateToFake() {
        using ::testing::_;
        ON_CALL(*this, folderDelimiter()).WillByDefault([this]() {
            return fake.folderDelimiter();
        });
        ON_CALL(*this, listMessages(_)).WillByDefault([this](const std::string & folderId) {
            return fake.listMessages(folderId);
        });
        ON_CALL(*this, fetchAttachment(_)).WillByDefault([this](const RemoteMessage & message) {
            return fake.fetchAttachment(message);
        });
        ON_CALL(*this, sendMessage(_, _, _)).WillByDefault([this](const std::string & folderId, const std::string & subject, const std::string & attachment) {
            return fake.sendMessage(folderId, subject, attachment);
        });
        ON_CALL(*this, deleteMessage(_)).WillByDefault([this](const RemoteMessage & message) {
            fake.deleteMessage(message);
        });
        ON_CALL(*this, createFolder(_)).WillByDefault([this](const std::string & folderId) {
            fake.createFolder(folderId);
        });
        ON_CALL(*this, listFolders(_)).WillByDefault([this](const std::string & parentFolderId) {
            return fake.listFolders(parentFolderId);
        });
        ON_CALL(*this, folderExists(_)).WillByDefault([this](const std::string & folderId) {
            return fake.folderExists(folderId);
        });
    }
};

#endif // MOCKMAILTRANSPORT_HPP

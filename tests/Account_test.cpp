#include <gtest/gtest.h>
#include "maildrive/models/account.hpp"
#include "maildrive/drive_exception.hpp"

#include <fstream>
#include <stdlib.h>
#include <unistd.h>

static nlohmann::json minimalAccount() {
    return {
        {"email_address", "someone@yahoo.com"},
        {"settings", {
            {"imap_password", "app-password"},
        }},
    };
}

TEST(Account, AppliesYahooDefaults) {
    Account account(minimalAccount());

    EXPECT_EQ("", account.valid());
    EXPECT_EQ("imap.mail.yahoo.com", account.IMAPHost());
    EXPECT_EQ(993u, account.IMAPPort());
    EXPECT_EQ("someone@yahoo.com", account.IMAPUsername());
    EXPECT_EQ("app-password", account.IMAPPassword());
    EXPECT_EQ("SSL", account.IMAPSecurity());
    EXPECT_FALSE(account.IMAPAllowInsecureSSL());
}

TEST(Account, ReadsExplicitSettings) {
    nlohmann::json json = minimalAccount();
    json["settings"]["imap_host"] = "imap.example.com";
    json["settings"]["imap_port"] = "143";
    json["settings"]["imap_username"] = "someone";
    json["settings"]["imap_security"] = "STARTTLS";
    json["settings"]["imap_allow_insecure_ssl"] = true;

    Account account(json);
    EXPECT_EQ("", account.valid());
    EXPECT_EQ("imap.example.com", account.IMAPHost());
    EXPECT_EQ(143u, account.IMAPPort());
    EXPECT_EQ("someone", account.IMAPUsername());
    EXPECT_EQ("STARTTLS", account.IMAPSecurity());
    EXPECT_TRUE(account.IMAPAllowInsecureSSL());
}

TEST(Account, ReportsFirstInvalidField) {
    nlohmann::json json = minimalAccount();
    json.erase("email_address");
    EXPECT_EQ("email_address", Account(json).valid());

    json = minimalAccount();
    json.erase("settings");
    EXPECT_EQ("settings", Account(json).valid());

    json = minimalAccount();
    json["settings"].erase("imap_password");
    EXPECT_EQ("imap_password", Account(json).valid());

    json = minimalAccount();
    json["settings"]["imap_port"] = "99x";
    EXPECT_EQ("imap_port", Account(json).valid());

    json = minimalAccount();
    json["settings"]["imap_security"] = "TLS1.3";
    EXPECT_EQ("imap_security", Account(json).valid());

    json = minimalAccount();
    json["settings"]["imap_allow_insecure_ssl"] = "yes";
    EXPECT_EQ("imap_allow_insecure_ssl", Account(json).valid());
}

TEST(Account, RedactsPasswordInJSON) {
    Account account(minimalAccount());
    nlohmann::json json = account.toJSON();
    EXPECT_EQ("********", json["settings"]["imap_password"].get<std::string>());
    EXPECT_EQ("app-password", account.IMAPPassword());
}

TEST(Account, LoadsFromFile) {
    char tmpl[] = "/tmp/maildrive_credentials_XXXXXX";
    int fd = mkstemp(tmpl);
    ASSERT_NE(-1, fd);
    close(fd);
    std::string path = tmpl;

    {
        std::ofstream out(path);
        out << minimalAccount().dump();
    }
    std::shared_ptr<Account> account = Account::fromFile(path);
    EXPECT_EQ("someone@yahoo.com", account->emailAddress());

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    try {
        Account::fromFile(path);
        FAIL() << "Expected DriveException";
    } catch (DriveException & ex) {
        EXPECT_EQ("credentials-invalid", ex.key);
    }

    unlink(path.c_str());
}

TEST(Account, MissingFileIsNotFound) {
    try {
        Account::fromFile("/tmp/maildrive-no-such-credentials.json");
        FAIL() << "Expected NotFoundException";
    } catch (NotFoundException & ex) {
        EXPECT_EQ("credentials-not-found", ex.key);
        EXPECT_EQ("/tmp/maildrive-no-such-credentials.json", ex.target);
    }
}

#include "maildrive/mail_utils.hpp"
#include "maildrive/models/account.hpp"
#include "maildrive/constants.hpp"

#include <stdarg.h>
#include <stdlib.h>
#include "spdlog/spdlog.h"

std::string MailUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

std::string MailUtils::localTimestampForTime(time_t time) {
    if (time <= 0) {
        return "";
    }
    tm * ptm = localtime(&time);
    char buffer[32];
    strftime(buffer, 32, "%Y-%m-%d %H:%M", ptm);
    return std::string(buffer);
}

std::string MailUtils::humanReadableSize(uint64_t bytes) {
    static const char * units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = (double)bytes;
    int unit = 0;
    while (value >= 1024 && unit < 4) {
        value /= 1024;
        unit ++;
    }
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
    return std::string(buffer);
}

std::string MailUtils::namespacePrefixOrBlank(mailcore::IMAPSession * session) {
    mailcore::IMAPNamespace * ns = session->defaultNamespace();
    if (ns == nullptr || ns->mainPrefix() == nullptr) {
        return "";
    }
    return ns->mainPrefix()->UTF8Characters();
}

std::string MailUtils::pathWithNamespacePrefix(std::string path, std::string prefix, char delimiter) {
    // note: the prefix may or may not end with the delimiter character
    if (prefix == "" || path.find(prefix) == 0) {
        return path;
    }
    if (prefix[prefix.length() - 1] == delimiter) {
        return prefix + path;
    }
    return prefix + delimiter + path;
}

static void mcLogToSpdlog(const char * user, const char * filename, unsigned int line, int dumpStack, const char * format, ...) {
    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    spdlog::get("logger")->debug("[mailcore {}:{}] {}", filename, line, buffer);
}

void MailUtils::enableVerboseLogging() {
    MCLogEnabled = 1;
    MCLogFn = &mcLogToSpdlog;
}

void MailUtils::configureSessionForAccount(mailcore::IMAPSession & session, std::shared_ptr<Account> account) {
    session.setHostname(AS_MCSTR(account->IMAPHost()));
    session.setPort(account->IMAPPort());
    session.setUsername(AS_MCSTR(account->IMAPUsername()));
    session.setPassword(AS_MCSTR(account->IMAPPassword()));

    std::string security = account->IMAPSecurity();
    if (security == "SSL") {
        session.setConnectionType(mailcore::ConnectionType::ConnectionTypeTLS);
    } else if (security == "STARTTLS") {
        session.setConnectionType(mailcore::ConnectionType::ConnectionTypeStartTLS);
    } else {
        session.setConnectionType(mailcore::ConnectionType::ConnectionTypeClear);
    }
    session.setCheckCertificateEnabled(!account->IMAPAllowInsecureSSL());
    session.setTimeout(60);
}

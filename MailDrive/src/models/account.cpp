#include "maildrive/models/account.hpp"
#include "maildrive/constants.hpp"
#include "maildrive/drive_exception.hpp"

#include <fstream>
#include <sstream>

Account::Account(nlohmann::json json) : _data(json) {

}

std::shared_ptr<Account> Account::fromFile(std::string path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.good()) {
        throw NotFoundException("credentials-not-found", path, "Could not read the credentials file '" + path + "'.");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        return std::make_shared<Account>(nlohmann::json::parse(buffer.str()));
    } catch (nlohmann::json::parse_error & ex) {
        throw DriveException("credentials-invalid", "The credentials file '" + path + "' is not valid JSON: " + ex.what(), path);
    }
}

std::string Account::valid() {
    if (!_data.is_object()) {
        return "email_address and settings";
    }
    if (!_data.count("email_address") || !_data["email_address"].is_string()) {
        return "email_address";
    }
    if (!_data.count("settings") || !_data["settings"].is_object()) {
        return "settings";
    }

    nlohmann::json & s = _data["settings"];

    if (!(s.count("imap_password") && s["imap_password"].is_string())) {
        return "imap_password";
    }
    if (s.count("imap_port") && !(s["imap_port"].is_number_unsigned() || s["imap_port"].is_string())) {
        return "imap_port";
    }
    if (s.count("imap_port") && s["imap_port"].is_string()) {
        std::string port = s["imap_port"].get<std::string>();
        if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos) {
            return "imap_port";
        }
    }
    if (s.count("imap_security")) {
        std::string security = s["imap_security"].is_string() ? s["imap_security"].get<std::string>() : "";
        if (security != "SSL" && security != "STARTTLS" && security != "none") {
            return "imap_security";
        }
    }
    if (s.count("imap_allow_insecure_ssl") && !s["imap_allow_insecure_ssl"].is_boolean()) {
        return "imap_allow_insecure_ssl";
    }
    return ""; // true
}

std::string Account::emailAddress() {
    return _data["email_address"].get<std::string>();
}

unsigned int Account::IMAPPort() {
    nlohmann::json & s = _data["settings"];
    if (!s.count("imap_port")) {
        return MAILDRIVE_DEFAULT_IMAP_PORT;
    }
    nlohmann::json & val = s["imap_port"];
    return val.is_string() ? std::stoi(val.get<std::string>()) : val.get<unsigned int>();
}

std::string Account::IMAPHost() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_host") ? s["imap_host"].get<std::string>() : MAILDRIVE_DEFAULT_IMAP_HOST;
}

std::string Account::IMAPUsername() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_username") ? s["imap_username"].get<std::string>() : emailAddress();
}

std::string Account::IMAPPassword() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_password") ? s["imap_password"].get<std::string>() : "";
}

std::string Account::IMAPSecurity() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_security") ? s["imap_security"].get<std::string>() : MAILDRIVE_DEFAULT_IMAP_SECURITY;
}

bool Account::IMAPAllowInsecureSSL() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_allow_insecure_ssl") ? s["imap_allow_insecure_ssl"].get<bool>() : false;
}

nlohmann::json Account::toJSON() {
    nlohmann::json j = _data;
    if (j.count("settings") && j["settings"].count("imap_password")) {
        j["settings"]["imap_password"] = "********";
    }
    return j;
}

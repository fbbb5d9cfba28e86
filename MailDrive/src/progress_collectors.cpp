#include "maildrive/progress_collectors.hpp"

#include <iostream>
#include "spdlog/spdlog.h"

ConsoleProgress::ConsoleProgress(std::string label) : label(label) {

}

void ConsoleProgress::partTransferred(const std::string & name, unsigned int completed, unsigned int total) {
    double percentage = total > 0 ? (double)completed / total * 100 : 100;
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%.1f", percentage);
    std::cout << "\r" << label << " " << name << ": " << completed << "/" << total << " (" << buffer << "%)";
    if (completed >= total) {
        std::cout << "\n";
    }
    std::cout.flush();
}

void IMAPProgress::bodyProgress(mailcore::IMAPSession * session, unsigned int current, unsigned int maximum) {
    spdlog::get("logger")->trace("-- body progress {}/{}", current, maximum);
}

void IMAPProgress::itemsProgress(mailcore::IMAPSession * session, unsigned int current, unsigned int maximum) {
    spdlog::get("logger")->trace("-- items progress {}/{}", current, maximum);
}

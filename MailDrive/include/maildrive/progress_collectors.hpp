/** ProgressCollectors [MailDrive]
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

#ifndef ProgressCollectors_hpp
#define ProgressCollectors_hpp

#include <stdio.h>
#include <string>
#include "MailCore/MailCore.h"

/* Receives one call per part moved across the transport. */
class TransferProgress {
public:
    virtual ~TransferProgress() {}
    virtual void partTransferred(const std::string & name, unsigned int completed, unsigned int total) = 0;
};

/* Prints "\r<label> <completed>/<total> (<pct>%)" to stdout, ending the
 line once the last part is through. */
class ConsoleProgress : public TransferProgress {
    std::string label;

public:
    ConsoleProgress(std::string label);
    void partTransferred(const std::string & name, unsigned int completed, unsigned int total);
};

class IMAPProgress : public mailcore::IMAPProgressCallback {
public:
    void bodyProgress(mailcore::IMAPSession * session, unsigned int current, unsigned int maximum);
    void itemsProgress(mailcore::IMAPSession * session, unsigned int current, unsigned int maximum);
};

#endif /* ProgressCollectors_hpp */

/** DriveConfig [MailDrive]
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

#ifndef DriveConfig_hpp
#define DriveConfig_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"
#include "maildrive/constants.hpp"

/* Settings for one invocation. Passed by value into each pipeline, never
 stored globally. */
struct DriveConfig {
    std::string baseFolder = MAILDRIVE_DEFAULT_FOLDER;
    size_t maxPartSize = MAILDRIVE_DEFAULT_PART_SIZE;

    bool recurse = false;
    int maxDepth = -1; // negative: unlimited

    unsigned int startPart = 0;

    // When set, removed parts are copied here before being expunged.
    std::string trashFolder = "";

    bool debug = false;
    bool verbose = false;

    nlohmann::json toJSON() const {
        return {
            {"baseFolder", baseFolder},
            {"maxPartSize", maxPartSize},
            {"recurse", recurse},
            {"maxDepth", maxDepth},
            {"startPart", startPart},
            {"trashFolder", trashFolder},
            {"debug", debug},
            {"verbose", verbose},
        };
    }
};

#endif /* DriveConfig_hpp */

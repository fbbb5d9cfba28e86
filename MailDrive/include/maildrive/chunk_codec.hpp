/** ChunkCodec [MailDrive]
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

#ifndef ChunkCodec_hpp
#define ChunkCodec_hpp

#include <stdio.h>
#include <stdint.h>
#include <string>
#include <vector>

/* Identifies one part of a logical file. `index` is 0-based; the subject shown
 in the mailbox uses the 1-based ordinal. */
struct PartMetadata {
    std::string name;
    unsigned int index = 0;
    unsigned int totalParts = 1;
};

struct Part {
    PartMetadata metadata;
    uint32_t messageId = 0;
    std::string payload;
};

class ChunkCodec {
public:
    static unsigned int partCount(uint64_t size, size_t maxPartSize);

    static std::vector<std::string> split(const std::string & bytes, size_t maxPartSize);
    static std::string join(std::vector<Part> parts);

    static std::string encodeMetadata(const std::string & name, unsigned int index, unsigned int totalParts);
    static std::string encodeMetadata(const PartMetadata & metadata);
    static PartMetadata decodeMetadata(const std::string & subject);

    // Validates a part set using metadata only: consistent name and total,
    // every index in [0, totalParts) present. Duplicates are allowed here.
    static void checkComplete(const std::vector<PartMetadata> & parts);

    static std::string escapeName(const std::string & name);
    static std::string unescapeName(const std::string & escaped);
};

#endif /* ChunkCodec_hpp */

/**
 * @file ChunkLister.hpp
 * @brief Human-readable chunk table for a patch file
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <ostream>
#include <string>

namespace ffxiv::patch {

class ZiPatchFile;

/**
 * @class ChunkLister
 * @brief Prints one row per chunk and keeps a per-type tally
 *
 * Decode errors propagate to the caller; the rows and counts gathered
 * up to the failing chunk are kept.
 */
class ChunkLister {
public:
    explicit ChunkLister(std::ostream& out);

    /**
     * Print the table for every remaining chunk in the patch
     *
     * @throws ChunkDecodeError on a malformed chunk
     */
    void list(ZiPatchFile& patch);

    void printSummary() const;

    int total() const { return m_total; }
    const std::map<std::string, int>& counts() const { return m_counts; }

private:
    std::ostream& m_out;
    std::map<std::string, int> m_counts;
    int m_total = 0;
};

} // namespace ffxiv::patch

/**
 * @file ChunkLister.cpp
 * @brief Chunk table printing
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ChunkLister.hpp"
#include "ZiPatchFile.hpp"

#include <iomanip>

namespace ffxiv::patch {

namespace {
    const std::string RULE(80, '-');
}

ChunkLister::ChunkLister(std::ostream& out)
    : m_out(out)
{
}

void ChunkLister::list(ZiPatchFile& patch) {
    m_out << RULE << "\n";
    m_out << std::left << std::setw(14) << "Offset"
          << std::setw(10) << "Type"
          << std::setw(12) << "Size"
          << "Details" << "\n";
    m_out << RULE << "\n";

    while (auto chunk = patch.next()) {
        m_out << std::left << std::setw(14) << chunk->offset
              << std::setw(10) << chunk->typeName()
              << std::setw(12) << chunk->size
              << chunk->describe() << "\n";
        m_counts[chunk->typeName()]++;
        m_total++;
    }

    m_out << RULE << "\n";
    m_out << "Read " << patch.position() << " of " << patch.size() << " bytes\n";
}

void ChunkLister::printSummary() const {
    m_out << "\nChunk summary (" << m_total << " total):\n";
    for (const auto& [type, count] : m_counts) {
        m_out << "  " << std::left << std::setw(10) << type << count << "\n";
    }
}

} // namespace ffxiv::patch

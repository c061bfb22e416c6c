/**
 * Copyright (C) 2025, Bruce MacKinnon KC1FSZ
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
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#include "Telephony.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

const char* audioFormatName(AudioFormat format) {
    switch (format) {
    case AudioFormat::SLIN: return "slin";
    case AudioFormat::SLIN16: return "slin16";
    case AudioFormat::SLIN48: return "slin48";
    case AudioFormat::ULAW: return "ulaw";
    case AudioFormat::OPUS: return "opus";
    default: return "unknown";
    }
}

void FormatCaps::append(AudioFormat format, unsigned framingMs) {
    for (Entry& e : _entries) {
        if (e.format == format) {
            e.framingMs = framingMs;
            return;
        }
    }
    _entries.push_back({ format, framingMs });
}

bool FormatCaps::contains(AudioFormat format) const {
    for (const Entry& e : _entries)
        if (e.format == format)
            return true;
    return false;
}

bool FormatCaps::isCompatible(const FormatCaps& other) const {
    for (const Entry& e : _entries)
        if (other.contains(e.format))
            return true;
    return false;
}

string FormatCaps::names() const {
    string r;
    for (const Entry& e : _entries) {
        if (!r.empty())
            r += "|";
        r += audioFormatName(e.format);
    }
    return r;
}

    }
}

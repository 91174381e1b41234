/**
 * @file ble_transport.cpp
 * @brief BLE transport abstraction - Shared UUID and filter helpers
 * @version 2.0.0
 */

#include "ble_transport.h"
#include "config.h"
#include <ctype.h>

// Bluetooth base UUID tail after the 16-bit alias (0000xxxx-0000-1000-8000-00805f9b34fb)
static const char BASE_UUID_TAIL[] = "00001000800000805f9b34fb";

std::string canonicalUuid(const std::string& uuid) {
    std::string out;
    out.reserve(uuid.size());
    for (char c : uuid) {
        if (isxdigit((unsigned char)c)) {
            out.push_back((char)tolower((unsigned char)c));
        }
    }

    if (out.size() == 32 &&
        out.compare(0, 4, "0000") == 0 &&
        out.compare(8, std::string::npos, BASE_UUID_TAIL) == 0) {
        return out.substr(4, 4);
    }
    // 32-bit alias
    if (out.size() == 8 && out.compare(0, 4, "0000") == 0) {
        return out.substr(4, 4);
    }
    return out;
}

std::string canonicalAddress(const std::string& address) {
    std::string out;
    out.reserve(17);
    for (char c : address) {
        if (c == '_' || c == '-') {
            out.push_back(':');
        } else {
            out.push_back((char)toupper((unsigned char)c));
        }
    }
    return out;
}

// =============================================================================
// SCAN FILTER
// =============================================================================

ScanFilter::ScanFilter() :
    _minRssi(SCAN_MIN_RSSI_DBM)
{
    static const char* const defaults[] = SCAN_NAME_FILTERS;
    for (const char* name : defaults) {
        _nameFilters.push_back(name);
    }
}

void ScanFilter::setNameFilters(const std::vector<std::string>& filters) {
    _nameFilters.clear();
    for (const std::string& filter : filters) {
        std::string lower;
        for (char c : filter) {
            lower.push_back((char)tolower((unsigned char)c));
        }
        if (!lower.empty()) {
            _nameFilters.push_back(lower);
        }
    }
}

bool ScanFilter::accepts(const std::string& name, int8_t rssi) const {
    if (rssi < _minRssi) {
        return false;
    }
    if (_nameFilters.empty()) {
        return true;
    }
    if (name.empty()) {
        return false;
    }

    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back((char)tolower((unsigned char)c));
    }
    for (const std::string& filter : _nameFilters) {
        if (lower.find(filter) != std::string::npos) {
            return true;
        }
    }
    return false;
}

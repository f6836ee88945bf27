/**
WiFi Provisioner Network Service
Copyright (C)  2025 Seneral <contact@seneral.dev> and contributors

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU Lesser General Public License as
published by the Free Software Foundation, either version 3 of the
License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef SCAN_CACHE_H
#define SCAN_CACHE_H

#include "network.hpp"

#include <mutex>
#include <memory>

/**
 * Holds the single most recent scan result
 * Entries are immutable and swapped as a whole, readers never see a partial entry
 */
class ScanCache
{
public:
	ScanCache(long ttlMS) : ttlMS(ttlMS) {}

	// TTL-checked read, null if absent or expired
	std::shared_ptr<const ScanCacheEntry> get();
	// Last known entry regardless of age, null if no scan ever happened
	std::shared_ptr<const ScanCacheEntry> lastKnown();

	void put(std::vector<NetworkRecord> records);
	void invalidate();

private:
	long ttlMS;
	std::mutex mutex;
	std::shared_ptr<const ScanCacheEntry> entry;
};

#endif // SCAN_CACHE_H

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

#include "scan_cache.hpp"

#include "util/log.hpp"

std::shared_ptr<const ScanCacheEntry> ScanCache::get()
{
	std::unique_lock lock(mutex);
	if (!entry) return nullptr;
	if (dtMS(entry->capturedAt, sclock::now()) >= ttlMS)
		return nullptr;
	return entry;
}

std::shared_ptr<const ScanCacheEntry> ScanCache::lastKnown()
{
	std::unique_lock lock(mutex);
	return entry;
}

void ScanCache::put(std::vector<NetworkRecord> records)
{
	auto newEntry = std::make_shared<ScanCacheEntry>();
	newEntry->records = std::move(records);
	newEntry->capturedAt = sclock::now();
	LOG(LScan, LDebug, "Cached %d networks", (int)newEntry->records.size());
	std::unique_lock lock(mutex);
	entry = std::move(newEntry);
}

void ScanCache::invalidate()
{
	std::unique_lock lock(mutex);
	if (entry)
		LOG(LScan, LDebug, "Invalidated network cache");
	entry.reset();
}

// AMOCA - Database Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/db/database.h>
#include <amoca/db/leveldb.h>
#include <amoca/util/logging.h>

namespace amoca {
namespace db {

// ============================================================================
// Status
// ============================================================================

std::string Status::ToString() const {
    const char* name = "OK";
    switch (code_) {
        case OK:               return "OK";
        case NOT_FOUND:        name = "NotFound"; break;
        case CORRUPTION:       name = "Corruption"; break;
        case NOT_SUPPORTED:    name = "NotSupported"; break;
        case INVALID_ARGUMENT: name = "InvalidArgument"; break;
        case IO_ERROR:         name = "IOError"; break;
    }
    if (message_.empty()) {
        return name;
    }
    return std::string(name) + ": " + message_;
}

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions& /*options*/, const Slice& key,
                           std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions& /*options*/, const Slice& key,
                           const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions& /*options*/, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions& /*options*/, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions& /*options*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.write_buffer_size = options.write_buffer_size;
    
    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }
    
    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }
    
    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    
    if (!s.ok()) {
        delete cache;
        delete filter;
        
        LOG_ERROR(util::LogCategory::DB) << "Failed to open LevelDB at "
                                         << path.string() << ": " << s.ToString();
        if (s.IsCorruption()) {
            return {Status::Corruption(s.ToString()), nullptr};
        } else if (s.IsInvalidArgument()) {
            return {Status::InvalidArgument(s.ToString()), nullptr};
        }
        return {Status::IOError(s.ToString()), nullptr};
    }
    
    LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, filter)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return Status::IOError(s.ToString());
    }
    return Status::Ok();
}

} // namespace db
} // namespace amoca

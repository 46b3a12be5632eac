// AMOCA - LevelDB Wrapper
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// This file provides the LevelDB implementation of the database interface,
// and an in-memory store for ledgers that are never written to disk.

#ifndef AMOCA_DB_LEVELDB_H
#define AMOCA_DB_LEVELDB_H

#include <amoca/db/database.h>
#include <map>
#include <mutex>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

namespace amoca {
namespace db {

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;
    
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}
    
    bool Valid() const override { return iter_->Valid(); }
    
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    
    void Next() override { iter_->Next(); }
    
    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }
    
    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }
    
    Status status() const override {
        leveldb::Status s = iter_->status();
        if (s.ok()) return Status::Ok();
        if (s.IsNotFound()) return Status::NotFound(s.ToString());
        if (s.IsCorruption()) return Status::Corruption(s.ToString());
        return Status::IOError(s.ToString());
    }
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    
    static Status ConvertStatus(const leveldb::Status& s) {
        if (s.ok()) return Status::Ok();
        if (s.IsNotFound()) return Status::NotFound(s.ToString());
        if (s.IsCorruption()) return Status::Corruption(s.ToString());
        if (s.IsIOError()) return Status::IOError(s.ToString());
        if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
        if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
        return Status::IOError(s.ToString());
    }
    
    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        lo.fill_cache = opts.fill_cache;
        return lo;
    }
    
    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }
    
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter)
        : db_(db), cache_(cache), filter_policy_(filter) {}
    
    ~LevelDBDatabase() override {
        // The DB references the cache and filter policy
        db_.reset();
        cache_.reset();
        filter_policy_.reset();
    }
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        leveldb::Slice lkey(key.data(), key.size());
        return ConvertStatus(db_->Get(MakeReadOptions(options), lkey, value));
    }
    
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        leveldb::Slice lkey(key.data(), key.size());
        leveldb::Slice lval(value.data(), value.size());
        return ConvertStatus(db_->Put(MakeWriteOptions(options), lkey, lval));
    }
    
    Status Delete(const WriteOptions& options, const Slice& key) override {
        leveldb::Slice lkey(key.data(), key.size());
        return ConvertStatus(db_->Delete(MakeWriteOptions(options), lkey));
    }
    
    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        return ConvertStatus(db_->Write(MakeWriteOptions(options), &lb));
    }
    
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
    }
    
    const char* GetName() const override { return "leveldb"; }
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Simple in-memory database for testing and for ledgers that never
 * touch disk.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
    
public:
    MemoryDatabase() = default;
    
    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    
    /// Iterates over a copy taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    
    const char* GetName() const override { return "memory"; }
    
    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
    
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }
};

/**
 * Iterator over an owned snapshot of a MemoryDatabase.
 */
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
    
public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}
    
    bool Valid() const override { return iter_ != data_.end(); }
    
    void SeekToFirst() override { iter_ = data_.begin(); }
    
    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }
    
    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }
    
    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace amoca

#endif // AMOCA_DB_LEVELDB_H

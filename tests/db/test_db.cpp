// AMOCA - Database Tests
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <gtest/gtest.h>
#include <amoca/db/database.h>
#include <amoca/db/leveldb.h>
#include <filesystem>
#include <random>

using namespace amoca;
using namespace amoca::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;
    
    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);
        
        testDir_ = std::filesystem::temp_directory_path() / 
                   ("amoca_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }
    
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
    
    std::unique_ptr<Database> Open(const std::string& name = "test_db") {
        Options opts;
        opts.create_if_missing = true;
        auto [status, db] = OpenDatabase(testDir_ / name, opts);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

// ============================================================================
// Basic Database Tests
// ============================================================================

TEST_F(DatabaseTest, OpenAndClose) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
}

TEST_F(DatabaseTest, PutAndGet) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    
    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());
    
    std::string value;
    Status s = db->Get(Slice("key1"), &value);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(value, "value1");
}

TEST_F(DatabaseTest, GetNotFound) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    
    std::string value;
    EXPECT_TRUE(db->Get(Slice("nonexistent"), &value).IsNotFound());
}

TEST_F(DatabaseTest, Delete) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    
    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());
    ASSERT_TRUE(db->Delete(Slice("key1")).ok());
    
    std::string value;
    EXPECT_TRUE(db->Get(Slice("key1"), &value).IsNotFound());
}

TEST_F(DatabaseTest, WriteBatch) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    
    db::WriteBatch batch;
    batch.Put(Slice("key1"), Slice("value1"));
    batch.Put(Slice("key2"), Slice("value2"));
    batch.Put(Slice("key3"), Slice("value3"));
    batch.Delete(Slice("key2"));
    EXPECT_EQ(batch.Count(), 4u);
    
    ASSERT_TRUE(db->Write(&batch).ok());
    
    std::string value;
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(db->Get(Slice("key2"), &value).IsNotFound());
    ASSERT_TRUE(db->Get(Slice("key3"), &value).ok());
    EXPECT_EQ(value, "value3");
}

TEST_F(DatabaseTest, IteratorIsOrdered) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    
    db->Put(Slice("c"), Slice("3"));
    db->Put(Slice("a"), Slice("1"));
    db->Put(Slice("b"), Slice("2"));
    
    auto iter = db->NewIterator();
    std::string keys;
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
        keys += iter->key().ToString();
    }
    EXPECT_EQ(keys, "abc");
    EXPECT_TRUE(iter->status().ok());
}

TEST_F(DatabaseTest, IteratorSeekPrefix) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    
    db->Put(MakeKey(prefix::STAKE, Slice("1")), Slice("x"));
    db->Put(MakeKey(prefix::STAKE, Slice("2")), Slice("y"));
    db->Put(MakeKey(prefix::PROPOSAL, Slice("1")), Slice("z"));
    
    std::string stakePrefix = MakeKey(prefix::STAKE);
    auto iter = db->NewIterator();
    int count = 0;
    for (iter->Seek(stakePrefix); iter->Valid() && iter->key().starts_with(stakePrefix);
         iter->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 2);
}

TEST_F(DatabaseTest, Exists) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    
    db->Put(Slice("key1"), Slice("value1"));
    EXPECT_TRUE(db->Exists(Slice("key1")));
    EXPECT_FALSE(db->Exists(Slice("key2")));
}

TEST_F(DatabaseTest, ReopenKeepsData) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        db::WriteBatch batch;
        batch.Put(Slice("persist"), Slice("yes"));
        batch.Put(Slice("gone"), Slice("soon"));
        ASSERT_TRUE(db->Write(&batch).ok());
        ASSERT_TRUE(db->Delete(Slice("gone")).ok());
    }
    
    auto db = Open();
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get(Slice("persist"), &value).ok());
    EXPECT_EQ(value, "yes");
    EXPECT_FALSE(db->Exists(Slice("gone")));
}

TEST_F(DatabaseTest, DestroyRemovesData) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        db->Put(Slice("key"), Slice("value"));
    }
    ASSERT_TRUE(DestroyDatabase(testDir_ / "test_db").ok());
    
    auto db = Open();
    ASSERT_NE(db, nullptr);
    EXPECT_FALSE(db->Exists(Slice("key")));
}

// ============================================================================
// Memory Database Tests
// ============================================================================

TEST_F(DatabaseTest, MemoryDatabaseBasic) {
    MemoryDatabase db;
    
    ASSERT_TRUE(db.Put(WriteOptions(), Slice("key"), Slice("value")).ok());
    
    std::string value;
    ASSERT_TRUE(db.Get(ReadOptions(), Slice("key"), &value).ok());
    EXPECT_EQ(value, "value");
    EXPECT_EQ(db.Size(), 1u);
    EXPECT_STREQ(db.GetName(), "memory");
    
    db.Clear();
    EXPECT_EQ(db.Size(), 0u);
}

TEST_F(DatabaseTest, MemoryIteratorIsSnapshot) {
    MemoryDatabase db;
    db.Put(Slice("a"), Slice("1"));
    
    auto iter = db.NewIterator();
    db.Put(Slice("b"), Slice("2"));
    
    int count = 0;
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1);
}

// ============================================================================
// LevelDB Tests
// ============================================================================

TEST_F(DatabaseTest, OpenDatabaseUsesLevelDB) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    EXPECT_STREQ(db->GetName(), "leveldb");
}

TEST_F(DatabaseTest, ReopenKeepsBinaryValues) {
    {
        auto db = Open("bin_db");
        ASSERT_NE(db, nullptr);
        db::WriteBatch batch;
        batch.Put(Slice("a"), Slice(std::string("\0bin", 4)));
        batch.Put(Slice("b"), Slice(""));
        ASSERT_TRUE(db->Write(&batch).ok());
    }
    
    auto db = Open("bin_db");
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get(Slice("a"), &value).ok());
    EXPECT_EQ(value, std::string("\0bin", 4));
    ASSERT_TRUE(db->Get(Slice("b"), &value).ok());
    EXPECT_TRUE(value.empty());
}

TEST_F(DatabaseTest, OpenOptions) {
    Options noCreate;
    noCreate.create_if_missing = false;
    auto [missing, none] = OpenDatabase(testDir_ / "absent", noCreate);
    EXPECT_FALSE(missing.ok());
    EXPECT_EQ(none, nullptr);
    
    {
        auto db = Open("exclusive_db");
        ASSERT_NE(db, nullptr);
        ASSERT_TRUE(db->Put(Slice("k"), Slice("v")).ok());
    }
    Options exclusive;
    exclusive.create_if_missing = true;
    exclusive.error_if_exists = true;
    auto [exists, db] = OpenDatabase(testDir_ / "exclusive_db", exclusive);
    EXPECT_FALSE(exists.ok());
    EXPECT_EQ(db, nullptr);
}

// ============================================================================
// Serialization Helpers
// ============================================================================

TEST_F(DatabaseTest, SerializeToStringRoundTrip) {
    uint64_t in = 0x0102030405060708ULL;
    std::string encoded = SerializeToString(in);
    EXPECT_EQ(encoded.size(), 8u);
    
    uint64_t out = 0;
    EXPECT_TRUE(DeserializeFromString(encoded, out));
    EXPECT_EQ(out, in);
}

TEST_F(DatabaseTest, DeserializeRejectsTrailingBytes) {
    std::string encoded = SerializeToString(uint32_t(7)) + "x";
    uint32_t out = 0;
    EXPECT_FALSE(DeserializeFromString(encoded, out));
    EXPECT_FALSE(DeserializeFromString(std::string("ab"), out));
}

TEST_F(DatabaseTest, MakeKeyPrefixes) {
    Address addr;
    addr[0] = 0x42;
    std::string key = MakeKey(prefix::ACCOUNT, addr);
    ASSERT_EQ(key.size(), 21u);
    EXPECT_EQ(key[0], 'a');
    EXPECT_EQ(static_cast<uint8_t>(key[1]), 0x42);
    
    EXPECT_EQ(MakeKey(prefix::META, Slice("version")), "Mversion");
}

TEST(StatusTest, ToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_TRUE(Status::NotFound("x").IsNotFound());
    EXPECT_FALSE(Status::IOError("disk").ok());
}

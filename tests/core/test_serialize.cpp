// AMOCA - Serialization Tests
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <gtest/gtest.h>
#include <amoca/core/serialize.h>

namespace amoca {
namespace test {

// ============================================================================
// Integer Encoding
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream s;
    s << uint32_t(0x01020304);
    EXPECT_EQ(s.ToHex(), "04030201");
    
    DataStream t;
    t << uint64_t(1);
    EXPECT_EQ(t.ToHex(), "0100000000000000");
}

TEST(SerializeTest, SignedTimestamp) {
    DataStream s;
    s << int64_t(-1);
    EXPECT_EQ(s.ToHex(), "ffffffffffffffff");
    
    int64_t back = 0;
    s >> back;
    EXPECT_EQ(back, -1);
    EXPECT_TRUE(s.empty());
}

TEST(SerializeTest, MixedRecord) {
    DataStream s;
    s << uint8_t(7) << true << uint64_t(123456789) << std::string("title");
    
    uint8_t a = 0;
    bool b = false;
    uint64_t c = 0;
    std::string d;
    s >> a >> b >> c >> d;
    
    EXPECT_EQ(a, 7);
    EXPECT_TRUE(b);
    EXPECT_EQ(c, 123456789u);
    EXPECT_EQ(d, "title");
    EXPECT_TRUE(s.empty());
}

// ============================================================================
// CompactSize
// ============================================================================

TEST(CompactSizeTest, Boundaries) {
    struct Case { uint64_t value; size_t encodedSize; };
    for (const auto& c : {Case{0, 1}, Case{252, 1}, Case{253, 3}, Case{0xFFFF, 3},
                          Case{0x10000, 5}, Case{0xFFFFFFFF, 5}, Case{0x100000000ULL, 9}}) {
        DataStream s;
        WriteCompactSize(s, c.value);
        EXPECT_EQ(s.size(), c.encodedSize) << c.value;
    }
}

TEST(CompactSizeTest, RejectsNonCanonical) {
    // 0xFD prefix carrying a value that fits in one byte
    DataStream s(std::vector<uint8_t>{0xFD, 0x10, 0x00});
    EXPECT_THROW(ReadCompactSize(s), std::ios_base::failure);
}

TEST(CompactSizeTest, RejectsOversize) {
    DataStream s;
    WriteCompactSize(s, MAX_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(s), std::ios_base::failure);
}

// ============================================================================
// Strings, Vectors and Hashes
// ============================================================================

TEST(SerializeTest, EmptyString) {
    DataStream s;
    s << std::string();
    EXPECT_EQ(s.ToHex(), "00");
}

TEST(SerializeTest, ByteVector) {
    std::vector<uint8_t> in = {1, 2, 3};
    DataStream s;
    s << in;
    EXPECT_EQ(s.ToHex(), "03010203");
    
    std::vector<uint8_t> out;
    s >> out;
    EXPECT_EQ(out, in);
}

TEST(SerializeTest, HashesAreRaw) {
    Hash256 h;
    h[0] = 0xAA;
    Hash160 a;
    a[19] = 0xBB;
    
    DataStream s;
    s << h << a;
    EXPECT_EQ(s.size(), 52u);
    
    Hash256 h2;
    Hash160 a2;
    s >> h2 >> a2;
    EXPECT_EQ(h2, h);
    EXPECT_EQ(a2, a);
}

TEST(SerializeTest, TruncatedInputThrows) {
    DataStream s(std::vector<uint8_t>{0x01, 0x02});
    uint32_t v = 0;
    EXPECT_THROW(s >> v, std::ios_base::failure);
    
    DataStream t(std::vector<uint8_t>{0x05, 'a', 'b'});
    std::string str;
    EXPECT_THROW(t >> str, std::ios_base::failure);
}

TEST(DataStreamTest, GetStringReturnsUnread) {
    DataStream s;
    s << uint8_t('x') << uint8_t('y');
    uint8_t first = 0;
    s >> first;
    EXPECT_EQ(s.GetString(), "y");
    EXPECT_EQ(s.GetBytes().size(), 1u);
    s.clear();
    EXPECT_TRUE(s.empty());
}

} // namespace test
} // namespace amoca

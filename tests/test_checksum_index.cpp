/**
 * ROM Audit - Checksum Index Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "audit/ChecksumIndex.hpp"
#include "TestCatalog.hpp"

using namespace romaudit;
using namespace romaudit::test;

class ChecksumIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog.addMachine(machine("zeta", {
            rom("a.bin", bytes("shared")),
            rom("b.bin", bytes("shared")),
            rom("c.bin", bytes("unique")),
            noDump("d.bin")
        }));
        catalog.addMachine(machine("alpha", {rom("x.bin", bytes("shared"))}));
        
        // Older DATs only carry a CRC
        ContentPart crcOnly;
        crcOnly.name = "old.bin";
        crcOnly.checksum = Checksum();
        crcOnly.checksum->crc = computeChecksum(bytes("unique")).crc;
        catalog.addMachine(machine("legacy", {crcOnly}));
        
        index = ChecksumIndex::build(catalog);
    }
    
    MemoryCatalog catalog;
    std::shared_ptr<const ChecksumIndex> index;
};

TEST_F(ChecksumIndexTest, PreservesDuplicateDeclarations) {
    auto locations = index->lookup(computeChecksum(bytes("shared")));
    
    ASSERT_EQ(locations.size(), 3u);
    EXPECT_EQ(locations[0], (ContentLocation{"alpha", "x.bin"}));
    EXPECT_EQ(locations[1], (ContentLocation{"zeta", "a.bin"}));
    EXPECT_EQ(locations[2], (ContentLocation{"zeta", "b.bin"}));
}

TEST_F(ChecksumIndexTest, ExcludesNoDumps) {
    EXPECT_EQ(index->declarationCount(), 5u);
    for (const auto& [checksum, locations] : index->contents()) {
        for (const auto& location : locations) {
            EXPECT_NE(location.name, "d.bin");
        }
    }
}

TEST_F(ChecksumIndexTest, MatchesPartialChecksums) {
    auto locations = index->lookup(computeChecksum(bytes("unique")));
    
    ASSERT_EQ(locations.size(), 2u);
    EXPECT_EQ(locations[0].machine, "legacy");
    EXPECT_EQ(locations[1].machine, "zeta");
    
    Checksum sha1Only;
    sha1Only.sha1 = computeChecksum(bytes("unique")).sha1;
    auto bySha1 = index->lookup(sha1Only);
    ASSERT_EQ(bySha1.size(), 1u);
    EXPECT_EQ(bySha1[0].machine, "zeta");
}

TEST_F(ChecksumIndexTest, UnknownContent) {
    EXPECT_FALSE(index->contains(computeChecksum(bytes("nobody"))));
    EXPECT_TRUE(index->lookup(computeChecksum(bytes("nobody"))).empty());
    EXPECT_TRUE(index->contains(computeChecksum(bytes("shared"))));
}

TEST_F(ChecksumIndexTest, CountsDistinctContent) {
    // The CRC-only declaration of unique joins its full checksum
    EXPECT_EQ(index->contents().size(), 3u);
    EXPECT_EQ(index->distinctCount(), 2u);
    
    const auto& distinct = index->distinctContents();
    auto unique = distinct.find(computeChecksum(bytes("unique")));
    ASSERT_NE(unique, distinct.end());
    ASSERT_EQ(unique->second.size(), 2u);
    EXPECT_EQ(unique->second[0], (ContentLocation{"legacy", "old.bin"}));
    EXPECT_EQ(unique->second[1], (ContentLocation{"zeta", "c.bin"}));
}

TEST_F(ChecksumIndexTest, AmbiguousPartialChecksumStaysSeparate) {
    MemoryCatalog colliding;
    
    ContentPart first = rom("a.bin", bytes("first"));
    ContentPart second = rom("b.bin", bytes("second"));
    second.checksum->crc = first.checksum->crc;
    ContentPart crcOnly;
    crcOnly.name = "c.bin";
    crcOnly.checksum = Checksum();
    crcOnly.checksum->crc = first.checksum->crc;
    colliding.addMachine(machine("m", {first, second, crcOnly}));
    
    auto collidingIndex = ChecksumIndex::build(colliding);
    EXPECT_EQ(collidingIndex->distinctCount(), 3u);
    EXPECT_EQ(collidingIndex->lookup(*crcOnly.checksum).size(), 3u);
}

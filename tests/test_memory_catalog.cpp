/**
 * ROM Audit - Memory Catalog Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "TestCatalog.hpp"

using namespace romaudit;
using namespace romaudit::test;

class MemoryCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog.addMachine(machine("pacman", {rom("pac.6e", bytes("pac"))}));
        
        MachineRecord puckman = clone("puckman", "pacman", {rom("pac.6e", bytes("pac"), "pac.6e")});
        puckman.machine.sampleOf = "pacsamples";
        puckman.samples.push_back({"chomp"});
        puckman.deviceRefs.push_back("z80");
        catalog.addMachine(puckman);
    }
    
    MemoryCatalog catalog;
};

TEST_F(MemoryCatalogTest, KeepsInsertionOrder) {
    catalog.addMachine(machine("alpha"));
    
    std::vector<std::string> expected{"pacman", "puckman", "alpha"};
    EXPECT_EQ(catalog.listMachines(), expected);
    EXPECT_EQ(catalog.machineCount(), 3u);
}

TEST_F(MemoryCatalogTest, RejectsDuplicateMachine) {
    EXPECT_FALSE(catalog.addMachine(machine("pacman", {rom("other", bytes("x"))})));
    
    auto parts = catalog.getPartsOf("pacman");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].name, "pac.6e");
    EXPECT_EQ(catalog.machineCount(), 2u);
}

TEST_F(MemoryCatalogTest, ResolvesRelations) {
    EXPECT_EQ(catalog.resolveParent("puckman", ParentRelation::CloneOf), std::string("pacman"));
    EXPECT_EQ(catalog.resolveParent("puckman", ParentRelation::RomOf), std::string("pacman"));
    EXPECT_FALSE(catalog.resolveParent("pacman", ParentRelation::CloneOf).has_value());
    
    // Declared references are returned even if the target is absent
    EXPECT_EQ(catalog.resolveSampleParent("puckman"), std::string("pacsamples"));
    EXPECT_FALSE(catalog.contains("pacsamples"));
}

TEST_F(MemoryCatalogTest, ReturnsDeclaredContent) {
    ASSERT_EQ(catalog.getSamplesOf("puckman").size(), 1u);
    EXPECT_EQ(catalog.getSamplesOf("puckman")[0].name, "chomp");
    EXPECT_EQ(catalog.getDeviceRefsOf("puckman"), std::vector<std::string>{"z80"});
    EXPECT_TRUE(catalog.getPartsOf("puckman")[0].isMerged());
}

TEST_F(MemoryCatalogTest, UnknownMachineIsEmpty) {
    EXPECT_FALSE(catalog.getMachine("nothere").has_value());
    EXPECT_TRUE(catalog.getPartsOf("nothere").empty());
    EXPECT_TRUE(catalog.getIssuesOf("nothere").empty());
    EXPECT_FALSE(catalog.resolveParent("nothere", ParentRelation::RomOf).has_value());
}

TEST_F(MemoryCatalogTest, KeepsImportIssues) {
    MachineRecord record = machine("broken", {noDump("bad.bin")});
    record.issues.push_back({IssueKind::MalformedEntry, false, "broken", "bad.bin", "malformed checksum"});
    catalog.addMachine(record);
    
    auto issues = catalog.getIssuesOf("broken");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::MalformedEntry);
}

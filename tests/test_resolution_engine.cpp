/**
 * ROM Audit - Resolution Engine Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <algorithm>

#include "audit/ResolutionEngine.hpp"
#include "TestCatalog.hpp"

using namespace romaudit;
using namespace romaudit::test;

class ResolutionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        MachineRecord bios = machine("neobios", {rom("bios.rom", bytes("bios"))});
        bios.machine.isBios = true;
        catalog.addMachine(bios);
        
        MachineRecord game = machine("game", {
            rom("g1", bytes("g1")),
            rom("g2", bytes("g2")),
            rom("bios.rom", bytes("bios"), "bios.rom")
        });
        game.machine.romOf = "neobios";
        catalog.addMachine(game);
        
        catalog.addMachine(clone("gamej", "game", {
            rom("g1", bytes("g1"), "g1"),
            rom("j2", bytes("j2")),
            rom("bios.rom", bytes("bios"), "bios.rom")
        }));
        
        catalog.addMachine(machine("solo", {rom("s1", bytes("s1")), rom("s2", bytes("s2"))}));
    }
    
    ResolutionResult resolve(const std::string& id, PackagingPolicy policy) {
        if (!index) {
            index = ChecksumIndex::build(catalog);
            engine = std::make_unique<ResolutionEngine>(catalog, index);
        }
        return engine->resolve(id, policy);
    }
    
    static const EffectivePart& part(const ResolutionResult& result, const std::string& name) {
        const auto& parts = result.set->parts;
        auto it = std::find_if(parts.begin(), parts.end(), [&name](const EffectivePart& p) {
            return p.name == name;
        });
        EXPECT_NE(it, parts.end()) << "no part " << name;
        return *it;
    }
    
    static bool hasFatalIssue(const ResolutionResult& result) {
        return std::any_of(result.issues.begin(), result.issues.end(), [](const CatalogIssue& issue) {
            return issue.fatal && issue.kind == IssueKind::CatalogIntegrity;
        });
    }
    
    MemoryCatalog catalog;
    std::shared_ptr<const ChecksumIndex> index;
    std::unique_ptr<ResolutionEngine> engine;
};

TEST_F(ResolutionEngineTest, MachineWithoutParentKeepsOwnParts) {
    for (auto policy : {PackagingPolicy::Split, PackagingPolicy::Merged, PackagingPolicy::NonMerged}) {
        auto result = resolve("solo", policy);
        ASSERT_TRUE(result.isSuccess());
        
        const auto& parts = result.set->parts;
        ASSERT_EQ(parts.size(), 2u);
        EXPECT_EQ(parts[0].name, "s1");
        EXPECT_EQ(parts[1].name, "s2");
        for (const auto& p : parts) {
            EXPECT_EQ(p.archive, "solo");
            EXPECT_EQ(p.origin, "solo");
            EXPECT_TRUE(p.required);
        }
        EXPECT_TRUE(result.issues.empty());
    }
}

TEST_F(ResolutionEngineTest, SplitExpectsMergedContentInAncestor) {
    auto result = resolve("gamej", PackagingPolicy::Split);
    ASSERT_TRUE(result.isSuccess());
    
    const auto& g1 = part(result, "g1");
    EXPECT_EQ(g1.archive, "game");
    EXPECT_EQ(g1.archiveEntryName, "g1");
    EXPECT_EQ(g1.origin, "game");
    EXPECT_TRUE(g1.merged);
    
    EXPECT_EQ(part(result, "j2").archive, "gamej");
    
    // Merged twice: clone -> parent -> BIOS
    const auto& bios = part(result, "bios.rom");
    EXPECT_EQ(bios.archive, "neobios");
    EXPECT_EQ(bios.origin, "neobios");
}

TEST_F(ResolutionEngineTest, NonMergedExpectsEverythingLocally) {
    auto result = resolve("gamej", PackagingPolicy::NonMerged);
    ASSERT_TRUE(result.isSuccess());
    
    ASSERT_EQ(result.set->parts.size(), 3u);
    for (const auto& p : result.set->parts) {
        EXPECT_EQ(p.archive, "gamej");
        EXPECT_EQ(p.archiveEntryName, p.name);
    }
    EXPECT_EQ(part(result, "g1").origin, "game");
    
    // Inherited checksum equals the ancestor's
    auto parent = resolve("game", PackagingPolicy::NonMerged);
    EXPECT_EQ(part(result, "g1").checksum, part(parent, "g1").checksum);
}

TEST_F(ResolutionEngineTest, MergedUsesFamilyArchive) {
    auto result = resolve("gamej", PackagingPolicy::Merged);
    ASSERT_TRUE(result.isSuccess());
    
    EXPECT_EQ(part(result, "g1").archive, "game");
    EXPECT_EQ(part(result, "j2").archive, "game");
    EXPECT_EQ(part(result, "bios.rom").archive, "neobios");
}

TEST_F(ResolutionEngineTest, MergedParentCarriesCloneContent) {
    auto result = resolve("game", PackagingPolicy::Merged);
    ASSERT_TRUE(result.isSuccess());
    
    ASSERT_EQ(result.set->parts.size(), 4u);
    EXPECT_TRUE(part(result, "g1").required);
    EXPECT_EQ(part(result, "bios.rom").archive, "neobios");
    
    const auto& j2 = part(result, "j2");
    EXPECT_FALSE(j2.required);
    EXPECT_EQ(j2.origin, "gamej");
    EXPECT_EQ(j2.archive, "game");
}

TEST_F(ResolutionEngineTest, SplitParentLeavesBiosContentInBios) {
    auto result = resolve("game", PackagingPolicy::Split);
    ASSERT_TRUE(result.isSuccess());
    
    EXPECT_EQ(part(result, "g1").archive, "game");
    EXPECT_EQ(part(result, "bios.rom").archive, "neobios");
    EXPECT_EQ(result.set->parts.size(), 3u);
}

TEST_F(ResolutionEngineTest, CyclicRomChainIsFatalForMembersOnly) {
    MachineRecord a = machine("cyc_a", {rom("a", bytes("a"))});
    a.machine.romOf = "cyc_b";
    MachineRecord b = machine("cyc_b", {rom("b", bytes("b"))});
    b.machine.romOf = "cyc_a";
    catalog.addMachine(a);
    catalog.addMachine(b);
    
    for (const std::string id : {"cyc_a", "cyc_b"}) {
        auto result = resolve(id, PackagingPolicy::Split);
        EXPECT_FALSE(result.isSuccess());
        EXPECT_EQ(result.error, ResolutionError::CatalogIntegrity);
        EXPECT_TRUE(hasFatalIssue(result));
        EXPECT_FALSE(result.set.has_value());
    }
    
    EXPECT_TRUE(resolve("solo", PackagingPolicy::Split).isSuccess());
    EXPECT_TRUE(resolve("gamej", PackagingPolicy::Split).isSuccess());
}

TEST_F(ResolutionEngineTest, SelfReferenceIsFatal) {
    MachineRecord self = machine("selfie", {rom("x", bytes("x"))});
    self.machine.cloneOf = "selfie";
    catalog.addMachine(self);
    
    auto result = resolve("selfie", PackagingPolicy::NonMerged);
    EXPECT_EQ(result.error, ResolutionError::CatalogIntegrity);
    EXPECT_NE(result.errorMessage.find("itself"), std::string::npos);
}

TEST_F(ResolutionEngineTest, DanglingParentDegradesMergedParts) {
    catalog.addMachine(clone("orphan", "gone", {rom("m", bytes("m"), "m"), rom("own", bytes("own"))}));
    
    auto result = resolve("orphan", PackagingPolicy::Split);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_FALSE(result.issues.empty());
    EXPECT_FALSE(hasFatalIssue(result));
    
    const auto& m = part(result, "m");
    EXPECT_TRUE(m.unresolved);
    EXPECT_EQ(m.archive, "orphan");
}

TEST_F(ResolutionEngineTest, MergeWithDifferentContentIsReported) {
    catalog.addMachine(clone("liar", "solo", {rom("s1", bytes("not s1"), "s1")}));
    
    auto result = resolve("liar", PackagingPolicy::Split);
    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].part, "s1");
    EXPECT_TRUE(part(result, "s1").unresolved);
    EXPECT_EQ(part(result, "s1").archive, "liar");
}

TEST_F(ResolutionEngineTest, MisspelledMergeResolvesByContent) {
    catalog.addMachine(clone("typo", "solo", {rom("s2", bytes("s2"), "s2_wrong")}));
    
    auto result = resolve("typo", PackagingPolicy::Split);
    ASSERT_TRUE(result.isSuccess());
    
    const auto& s2 = part(result, "s2");
    EXPECT_FALSE(s2.unresolved);
    EXPECT_EQ(s2.archive, "solo");
    EXPECT_EQ(s2.archiveEntryName, "s2");
    EXPECT_EQ(result.issues.size(), 1u);
}

TEST_F(ResolutionEngineTest, DuplicateLogicalNames) {
    catalog.addMachine(machine("twice", {rom("a", bytes("a")), rom("a", bytes("a"))}));
    catalog.addMachine(machine("conflict", {rom("a", bytes("a")), rom("a", bytes("b"))}));
    
    auto twice = resolve("twice", PackagingPolicy::NonMerged);
    ASSERT_TRUE(twice.isSuccess());
    EXPECT_EQ(twice.set->parts.size(), 1u);
    
    auto conflict = resolve("conflict", PackagingPolicy::NonMerged);
    EXPECT_EQ(conflict.error, ResolutionError::CatalogIntegrity);
    EXPECT_TRUE(hasFatalIssue(conflict));
}

TEST_F(ResolutionEngineTest, DevicePartsAreNotRequired) {
    MachineRecord device = machine("z80", {rom("z80.bin", bytes("z80"))});
    device.machine.isDevice = true;
    catalog.addMachine(device);
    
    MachineRecord board = machine("board", {rom("main", bytes("main")), rom("z80.bin", bytes("z80"))});
    board.deviceRefs.push_back("z80");
    catalog.addMachine(board);
    
    auto result = resolve("board", PackagingPolicy::NonMerged);
    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ(result.set->parts.size(), 1u);
    EXPECT_EQ(result.set->parts[0].name, "main");
}

TEST_F(ResolutionEngineTest, SamplesFollowSampleParent) {
    MachineRecord parent = machine("snd");
    parent.machine.sampleOf = "snd";
    parent.samples = {{"boom"}};
    catalog.addMachine(parent);
    
    MachineRecord child = clone("sndj", "snd");
    child.machine.sampleOf = "snd";
    child.samples = {{"boom"}, {"zap"}};
    catalog.addMachine(child);
    
    MachineRecord external = machine("ext");
    external.machine.sampleOf = "extsamples";
    external.samples = {{"x"}};
    catalog.addMachine(external);
    
    auto split = resolve("sndj", PackagingPolicy::Split);
    ASSERT_TRUE(split.isSuccess());
    ASSERT_EQ(split.set->samples.size(), 2u);
    EXPECT_EQ(split.set->samples[0].archive, "snd");
    EXPECT_EQ(split.set->samples[1].archive, "sndj");
    
    auto nonMerged = resolve("sndj", PackagingPolicy::NonMerged);
    EXPECT_EQ(nonMerged.set->samples[0].archive, "sndj");
    
    // sampleof naming itself is not a cycle
    auto owner = resolve("snd", PackagingPolicy::Split);
    ASSERT_TRUE(owner.isSuccess());
    EXPECT_TRUE(owner.issues.empty());
    
    auto ext = resolve("ext", PackagingPolicy::Split);
    ASSERT_TRUE(ext.isSuccess());
    EXPECT_EQ(ext.set->samples[0].archive, "extsamples");
}

TEST_F(ResolutionEngineTest, UnknownMachine) {
    auto result = resolve("nothere", PackagingPolicy::Split);
    EXPECT_EQ(result.error, ResolutionError::UnknownMachine);
    EXPECT_FALSE(result.set.has_value());
}

TEST_F(ResolutionEngineTest, NavigatesFamilies) {
    resolve("solo", PackagingPolicy::Split);
    
    EXPECT_EQ(engine->cloneRoot("gamej"), "game");
    EXPECT_EQ(engine->cloneRoot("game"), "game");
    EXPECT_EQ(engine->clonesOf("game"), std::vector<std::string>{"gamej"});
    
    auto ancestors = engine->ancestorsOf("gamej");
    ASSERT_TRUE(ancestors.has_value());
    EXPECT_EQ(*ancestors, (std::vector<std::string>{"game", "neobios"}));
}

TEST_F(ResolutionEngineTest, ImportIssuesAreCarried) {
    MachineRecord record = machine("degraded", {noDump("bad")});
    record.issues.push_back({IssueKind::MalformedEntry, false, "degraded", "bad", "malformed checksum"});
    catalog.addMachine(record);
    
    auto result = resolve("degraded", PackagingPolicy::NonMerged);
    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ(result.set->issues.size(), 1u);
    EXPECT_EQ(result.set->issues[0].kind, IssueKind::MalformedEntry);
    EXPECT_TRUE(result.set->parts[0].isNoDump());
}

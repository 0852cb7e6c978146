/**
 * ROM Audit - DAT Importer Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "dat/DatImporter.hpp"

using namespace romaudit;
using namespace romaudit::dat;

namespace {

const char* LOGIQX_DAT = R"(<?xml version="1.0"?>
<!DOCTYPE datafile PUBLIC "-//Logiqx//DTD ROM Management Datafile//EN" "http://www.logiqx.com/Dats/datafile.dtd">
<datafile>
    <header>
        <name>Test Arcade</name>
        <description>Test Arcade (v1)</description>
        <version>1</version>
        <author>tester</author>
    </header>
    <game name="parent" sampleof="parent">
        <description>Parent Game</description>
        <year>1981</year>
        <manufacturer>Acme</manufacturer>
        <rom name="p1.bin" size="4" crc="0123abcd" sha1="a9993e364706816aba3e25717850c26c9cd0d89d"/>
        <rom name="p2.bin" size="4" CRC="DEADBEEF" SHA1="F7C3BC1D808E04732ADF679965CCC34CA7AE3441"/>
        <rom name="pal.bin" size="260" status="nodump"/>
        <disk name="parent" sha1="da39a3ee5e6b4b0d3255bfef95601890afd80709"/>
        <sample name="boom"/>
    </game>
    <game name="clone" cloneof="parent" romof="parent">
        <description>Clone Game</description>
        <rom name="p1.bin" merge="p1.bin" size="4" crc="0123abcd" sha1="a9993e364706816aba3e25717850c26c9cd0d89d"/>
        <rom name="c1.bin" size="4" crc="11111111" status="baddump"/>
        <rom name="bad.bin" size="4" crc="nothex!"/>
        <rom size="4" crc="22222222"/>
        <rom name="opt.bin" size="abc" crc="33333333" optional="yes"/>
    </game>
    <game>
        <description>Unnamed</description>
    </game>
    <game name="parent">
        <rom name="dup.bin" size="1" crc="44444444"/>
    </game>
</datafile>
)";

const char* MAME_XML = R"(<?xml version="1.0"?>
<mame build="0.250">
    <Machine Name="neogeo" IsBios="yes">
        <rom name="sp-s2.sp1" size="131072" crc="9036d879" sha1="4f5ed7105b7128794654ce82b51723e16e389543"/>
    </Machine>
    <machine name="z80" isdevice="yes" runnable="no">
        <description>Zilog Z80</description>
    </machine>
    <machine name="mslug" romof="neogeo">
        <rom name="sp-s2.sp1" merge="sp-s2.sp1" size="131072" crc="9036d879" sha1="4f5ed7105b7128794654ce82b51723e16e389543"/>
        <device_ref name="z80"/>
        <chip type="cpu" name="Z80"/>
    </machine>
</mame>
)";

} // anonymous namespace

class DatImporterTest : public ::testing::Test {
protected:
    MemoryCatalog catalog;
};

TEST_F(DatImporterTest, ReadsHeaderAndMachines) {
    auto result = DatImporter::importContent(QByteArray(LOGIQX_DAT), catalog);
    
    ASSERT_TRUE(result.isSuccess()) << result.errorMessage;
    EXPECT_EQ(result.header.name, "Test Arcade");
    EXPECT_EQ(result.header.version, "1");
    EXPECT_EQ(result.header.author, "tester");
    EXPECT_EQ(result.machines, 2u);
    EXPECT_EQ(result.duplicateMachines, 1u);
    
    auto parent = catalog.getMachine("parent");
    ASSERT_TRUE(parent.has_value());
    EXPECT_EQ(parent->description, "Parent Game");
    EXPECT_EQ(parent->year, "1981");
    EXPECT_EQ(parent->manufacturer, "Acme");
    EXPECT_EQ(parent->sampleOf, "parent");
    
    auto clone = catalog.getMachine("clone");
    ASSERT_TRUE(clone.has_value());
    EXPECT_EQ(clone->cloneOf, "parent");
    EXPECT_EQ(clone->romOf, "parent");
}

TEST_F(DatImporterTest, FirstDefinitionOfMachineWins) {
    DatImporter::importContent(QByteArray(LOGIQX_DAT), catalog);
    
    auto parts = catalog.getPartsOf("parent");
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0].name, "p1.bin");
}

TEST_F(DatImporterTest, ParsesPartsCaseInsensitively) {
    DatImporter::importContent(QByteArray(LOGIQX_DAT), catalog);
    
    auto parts = catalog.getPartsOf("parent");
    ASSERT_EQ(parts.size(), 4u);
    
    ASSERT_TRUE(parts[1].checksum.has_value());
    EXPECT_EQ(parts[1].checksum->crcHex(), "deadbeef");
    EXPECT_EQ(parts[1].checksum->sha1, "f7c3bc1d808e04732adf679965ccc34ca7ae3441");
    EXPECT_EQ(parts[1].size, 4u);
    
    EXPECT_TRUE(parts[2].isNoDump());
    EXPECT_EQ(parts[2].size, 260u);
    
    EXPECT_EQ(parts[3].type, PartType::Disk);
    ASSERT_TRUE(parts[3].checksum.has_value());
    EXPECT_FALSE(parts[3].checksum->hasCrc());
    EXPECT_TRUE(parts[3].checksum->hasSha1());
    
    auto samples = catalog.getSamplesOf("parent");
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].name, "boom");
}

TEST_F(DatImporterTest, CoercesMalformedRecords) {
    auto result = DatImporter::importContent(QByteArray(LOGIQX_DAT), catalog);
    
    // Unnamed game and unnamed rom
    EXPECT_EQ(result.skippedRecords, 2u);
    EXPECT_EQ(result.degradedParts, 1u);
    
    auto parts = catalog.getPartsOf("clone");
    ASSERT_EQ(parts.size(), 4u);
    
    EXPECT_EQ(parts[0].merge, "p1.bin");
    
    EXPECT_TRUE(parts[1].badDump);
    ASSERT_TRUE(parts[1].checksum.has_value());
    EXPECT_EQ(parts[1].checksum->crcHex(), "11111111");
    
    EXPECT_EQ(parts[2].name, "bad.bin");
    EXPECT_TRUE(parts[2].isNoDump());
    
    EXPECT_EQ(parts[3].name, "opt.bin");
    EXPECT_TRUE(parts[3].isOptional);
    EXPECT_EQ(parts[3].size, 0u);
    EXPECT_FALSE(parts[3].isNoDump());
    
    auto issues = catalog.getIssuesOf("clone");
    ASSERT_EQ(issues.size(), 3u);
    for (const auto& issue : issues) {
        EXPECT_EQ(issue.kind, IssueKind::MalformedEntry);
        EXPECT_FALSE(issue.fatal);
    }
}

TEST_F(DatImporterTest, ReadsMameListXml) {
    auto result = DatImporter::importContent(QByteArray(MAME_XML), catalog);
    
    ASSERT_TRUE(result.isSuccess()) << result.errorMessage;
    EXPECT_EQ(result.machines, 3u);
    
    auto bios = catalog.getMachine("neogeo");
    ASSERT_TRUE(bios.has_value());
    EXPECT_TRUE(bios->isBios);
    ASSERT_EQ(catalog.getPartsOf("neogeo").size(), 1u);
    
    auto device = catalog.getMachine("z80");
    ASSERT_TRUE(device.has_value());
    EXPECT_TRUE(device->isDevice);
    EXPECT_FALSE(device->runnable);
    
    EXPECT_EQ(catalog.resolveParent("mslug", ParentRelation::RomOf), std::string("neogeo"));
    EXPECT_EQ(catalog.getDeviceRefsOf("mslug"), std::vector<std::string>{"z80"});
}

TEST_F(DatImporterTest, RejectsBrokenXml) {
    auto result = DatImporter::importContent(QByteArray("<datafile><game name=\"x\"><rom name=\"a\""), catalog);
    
    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.error, ImportError::ParseError);
    EXPECT_FALSE(result.errorMessage.empty());
}

TEST_F(DatImporterTest, ImportsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "romaudit-importer-test.dat";
    {
        std::ofstream file(path);
        file << MAME_XML;
    }
    
    auto result = DatImporter::importFile(path, catalog);
    std::filesystem::remove(path);
    
    ASSERT_TRUE(result.isSuccess()) << result.errorMessage;
    EXPECT_EQ(catalog.machineCount(), 3u);
}

TEST_F(DatImporterTest, ReportsMissingFile) {
    auto result = DatImporter::importFile("/nonexistent/romaudit/catalog.dat", catalog);
    
    EXPECT_EQ(result.error, ImportError::FileNotFound);
    EXPECT_EQ(catalog.machineCount(), 0u);
}

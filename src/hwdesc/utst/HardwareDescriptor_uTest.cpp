/**
 * @file HardwareDescriptor_uTest.cpp
 * @brief Unit tests for opssetup::hwdesc ports.yaml loading.
 */

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/utst/TempDir.hpp"
#include "src/hwdesc/inc/HardwareDescriptor.hpp"

#include <gtest/gtest.h>

#include <string>

using opssetup::SetupStatus;
using opssetup::helpers::TempDir;
using opssetup::hwdesc::HardwareDescriptor;
using opssetup::hwdesc::loadHardwareDescriptor;
using opssetup::hwdesc::parseHardwareDescriptor;

/* ----------------------------- Parsing ----------------------------- */

/** @test Port names are returned in document order, numbers as text. */
TEST(HardwareDescriptorTest, ParsesPortsInOrder) {
  const HardwareDescriptor DESC = parseHardwareDescriptor(R"(
ports:
  - name: 49
    pluggable: False
  - name: 50
  - name: 1-1
)");

  ASSERT_TRUE(DESC.ok()) << DESC.message;
  ASSERT_EQ(DESC.ports.size(), 3U);
  EXPECT_EQ(DESC.ports[0], "49");
  EXPECT_EQ(DESC.ports[1], "50");
  EXPECT_EQ(DESC.ports[2], "1-1");
}

/** @test An empty ports sequence is valid. */
TEST(HardwareDescriptorTest, EmptyPorts) {
  const HardwareDescriptor DESC = parseHardwareDescriptor("ports: []\n");
  ASSERT_TRUE(DESC.ok());
  EXPECT_TRUE(DESC.ports.empty());
}

/** @test Structural problems are PARSE_ERROR. */
TEST(HardwareDescriptorTest, MalformedDocuments) {
  EXPECT_EQ(parseHardwareDescriptor("- 1\n- 2\n").status, SetupStatus::PARSE_ERROR);
  EXPECT_EQ(parseHardwareDescriptor("other: 1\n").status, SetupStatus::PARSE_ERROR);
  EXPECT_EQ(parseHardwareDescriptor("ports: 3\n").status, SetupStatus::PARSE_ERROR);
  EXPECT_EQ(parseHardwareDescriptor("ports:\n  - speed: 10\n").status, SetupStatus::PARSE_ERROR);
  EXPECT_EQ(parseHardwareDescriptor("ports: [{name: 1}, {name: 1}]\n").status,
            SetupStatus::PARSE_ERROR);
  EXPECT_EQ(parseHardwareDescriptor("ports: [unclosed\n").status, SetupStatus::PARSE_ERROR);
}

/* ----------------------------- Loading ----------------------------- */

/** @test A missing file is IO_ERROR; a valid file loads. */
TEST(HardwareDescriptorTest, LoadFromFile) {
  const TempDir DIR;

  EXPECT_EQ(loadHardwareDescriptor(DIR.sub("ports.yaml")).status, SetupStatus::IO_ERROR);

  ASSERT_TRUE(opssetup::helpers::files::writeFile(DIR.sub("ports.yaml"),
                                                  "ports:\n  - name: 49\n  - name: 50\n"));
  const HardwareDescriptor DESC = loadHardwareDescriptor(DIR.sub("ports.yaml"));
  ASSERT_TRUE(DESC.ok()) << DESC.message;
  EXPECT_EQ(DESC.ports.size(), 2U);
  EXPECT_NE(DESC.toString().find("49,50"), std::string::npos);
}

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../appdeck/osa.h"
#include "test_util.h"

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

class OsaTest : public ::testing::Test {
 protected:
  std::vector<std::string> names;

  void SetUp() override { appdeck_set_log_file(nullptr); }
  void TearDown() override { appdeck_set_log_file(stderr); }
};

TEST_F(OsaTest, ParsePlainList) {
  osa_parse_name_list("Finder, Safari, Google Chrome\n", &names);
  EXPECT_THAT(names, ElementsAre("Finder", "Safari", "Google Chrome"));
}

TEST_F(OsaTest, ParseBracedQuotedList) {
  osa_parse_name_list("{\"Finder\", \"Visual Studio Code\", \"Mail\"}\n", &names);
  EXPECT_THAT(names, ElementsAre("Finder", "Visual Studio Code", "Mail"));
}

TEST_F(OsaTest, ParseSingleAndEmpty) {
  osa_parse_name_list("Finder\n", &names);
  EXPECT_THAT(names, ElementsAre("Finder"));

  osa_parse_name_list("\n", &names);
  EXPECT_THAT(names, IsEmpty());

  osa_parse_name_list("{}", &names);
  EXPECT_THAT(names, IsEmpty());
}

TEST_F(OsaTest, ParseKeepsCommasInsideNames) {
  // Only ", " separates items.
  osa_parse_name_list("Foo,Bar, Baz", &names);
  EXPECT_THAT(names, ElementsAre("Foo,Bar", "Baz"));
}

TEST_F(OsaTest, EscapeString) {
  EXPECT_EQ(osa_escape_string("Safari"), "Safari");
  EXPECT_EQ(osa_escape_string("My \"App\""), "My \\\"App\\\"");
  EXPECT_EQ(osa_escape_string("a\\b"), "a\\\\b");
}

TEST_F(OsaTest, BundleDisplayName) {
  EXPECT_EQ(osa_bundle_display_name("/Applications/Safari.app", "/Applications"), "Safari");
  EXPECT_EQ(osa_bundle_display_name("/Applications/Utilities/Terminal.app\n", "/Applications"), "Utilities/Terminal");
  EXPECT_EQ(osa_bundle_display_name("/Applications/Notes.app", "/Applications/"), "Notes");
  EXPECT_EQ(osa_bundle_display_name("/opt/Other.app", "/Applications"), "/opt/Other");
}

TEST_F(OsaTest, ScanDirHonorsDepth) {
  TempDir tmp;
  tmp.MakeDir("Safari.app/Contents");
  tmp.MakeDir("Utilities/Terminal.app/Contents");
  tmp.MakeDir("Utilities/Deep/Hidden.app");
  tmp.MakeDir("Xcode.app/Contents/Applications/Simulator.app");
  tmp.WriteFile("README.txt", "not an app");

  ASSERT_EQ(osa_scan_dir(tmp.path(), 2, &names), PROVIDER_OK);
  EXPECT_THAT(names, UnorderedElementsAre("Safari", "Utilities/Terminal", "Xcode"));

  ASSERT_EQ(osa_scan_dir(tmp.path(), 1, &names), PROVIDER_OK);
  EXPECT_THAT(names, UnorderedElementsAre("Safari", "Xcode"));

  ASSERT_EQ(osa_scan_dir(tmp.path(), 3, &names), PROVIDER_OK);
  EXPECT_THAT(names, UnorderedElementsAre("Safari", "Utilities/Terminal", "Utilities/Deep/Hidden", "Xcode"));
}

TEST_F(OsaTest, ScanEmptyDir) {
  TempDir tmp;
  names = {"stale"};
  ASSERT_EQ(osa_scan_dir(tmp.path(), 2, &names), PROVIDER_OK);
  EXPECT_THAT(names, IsEmpty());
}

TEST_F(OsaTest, ScanMissingDirFails) {
  TempDir tmp;
  EXPECT_EQ(osa_scan_dir(tmp.path() + "/missing", 2, &names), PROVIDER_ERR_ISSUE);
}

TEST_F(OsaTest, ScanInstalledUsesOptions) {
  TempDir tmp;
  tmp.MakeDir("Notes.app");
  OsaOptions options;
  options.applications_dir = tmp.path();
  AppProvider provider = osa_provider(&options);
  ASSERT_EQ(provider.user_data, &options);

  ASSERT_EQ(provider.scan_installed(provider.user_data, &names), PROVIDER_OK);
  EXPECT_THAT(names, ElementsAre("Notes"));
}

TEST_F(OsaTest, RunCaptureCollectsStdout) {
  std::string out;
  int exit_code = -1;
  ASSERT_EQ(process_run_capture({"echo", "hello", "world"}, &out, &exit_code), 0);
  EXPECT_EQ(out, "hello world\n");
  EXPECT_EQ(exit_code, 0);
}

TEST_F(OsaTest, RunCaptureReportsExitCode) {
  int exit_code = 0;
  ASSERT_EQ(process_run_capture({"sh", "-c", "exit 3"}, nullptr, &exit_code), 0);
  EXPECT_EQ(exit_code, 3);
}

TEST_F(OsaTest, RunCaptureMissingBinary) {
  int exit_code = 0;
  EXPECT_EQ(process_run_capture({"appdeck-no-such-binary"}, nullptr, &exit_code), -1);
  EXPECT_EQ(process_run_capture({}, nullptr, &exit_code), -1);
}

TEST_F(OsaTest, SpawnDetached) {
  EXPECT_EQ(process_spawn_detached({"true"}), 0);
  EXPECT_EQ(process_spawn_detached({"appdeck-no-such-binary"}), -1);
}

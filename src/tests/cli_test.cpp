#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>
#include "cli/cli.hpp"

using namespace imgxfer::cli;

namespace {

ProgramOptions parse(std::vector<const char*> args) {
  args.insert(args.begin(), "imgxfer");
  return parse_command_line(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(CommandLineTest, ParsesDownload) {
  ProgramOptions options = parse({"download", "--image-dir", "images", "--image-id", "disk1",
                                  "--host", "esx.example.com", "--port", "8443",
                                  "--datacenter", "dc1", "--datastore", "ds1",
                                  "--path", "vm/disk1-flat.vmdk",
                                  "--cookie", "vmware_soap_session=abc", "--cookie", "other=1",
                                  "--timeout", "120"});

  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.command, Command::DOWNLOAD);
  EXPECT_EQ(options.image_dir, "images");
  EXPECT_EQ(options.image_id, "disk1");
  EXPECT_EQ(options.host, "esx.example.com");
  EXPECT_EQ(options.port, 8443);
  EXPECT_EQ(options.datacenter, "dc1");
  EXPECT_EQ(options.datastore, "ds1");
  EXPECT_EQ(options.path, "vm/disk1-flat.vmdk");
  EXPECT_EQ(options.cookies, (std::vector<std::string>{"vmware_soap_session=abc", "other=1"}));
  EXPECT_EQ(options.timeout.count(), 120);
}

TEST(CommandLineTest, ParsesUploadWithDefaults) {
  ProgramOptions options = parse({"upload", "--image-dir", "images", "--image-id", "disk1",
                                  "--file", "disk1.vmdk", "--log-level", "debug"});

  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.command, Command::UPLOAD);
  EXPECT_EQ(options.file, "disk1.vmdk");
  EXPECT_EQ(options.port, 443);
  EXPECT_EQ(options.timeout.count(), 3600);
  EXPECT_EQ(options.log_level, imgxfer::logging::severity_level::debug);
  EXPECT_TRUE(options.log_file.empty());
}

TEST(CommandLineTest, RejectsInvalidInput) {
  EXPECT_FALSE(parse({}).valid);
  EXPECT_FALSE(parse({"convert", "--image-id", "disk1"}).valid);
  EXPECT_FALSE(parse({"upload", "--image-dir", "images", "--image-id"}).valid);
  EXPECT_FALSE(parse({"upload", "--image-dir", "images", "--image-id", "disk1", "--bogus", "1"}).valid);
  EXPECT_FALSE(parse({"upload", "--image-dir", "images", "--image-id", "disk1"}).valid);
  EXPECT_FALSE(parse({"download", "--image-dir", "images", "--image-id", "disk1",
                      "--host", "h", "--datacenter", "dc1", "--datastore", "ds1"}).valid);
  EXPECT_FALSE(parse({"download", "--image-dir", "images", "--image-id", "disk1", "--host", "h",
                      "--datacenter", "dc1", "--datastore", "ds1", "--path", "p", "--port", "70000"}).valid);
  EXPECT_FALSE(parse({"upload", "--image-dir", "images", "--image-id", "disk1",
                      "--file", "f", "--timeout", "0"}).valid);
  EXPECT_FALSE(parse({"upload", "--image-dir", "images", "--image-id", "disk1",
                      "--file", "f", "--log-level", "loud"}).valid);
}

TEST(CommandLineTest, RunReportsMissingImage) {
  const std::string image_dir =
    (std::filesystem::temp_directory_path() / "imgxfer_cli_test_images").string();
  ProgramOptions options = parse({"download", "--image-dir", image_dir.c_str(),
                                  "--image-id", "missing", "--host", "127.0.0.1",
                                  "--datacenter", "dc1", "--datastore", "ds1", "--path", "p"});
  ASSERT_TRUE(options.valid);
  EXPECT_EQ(run(options), 1);
  std::filesystem::remove_all(image_dir);
}

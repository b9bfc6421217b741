#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

#include "devready/platform/environment_file_store.hpp"

namespace devready::platform {
namespace {

namespace fs = std::filesystem;

class EnvironmentFileStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::random_device rd;
    dir_ = fs::temp_directory_path() /
           ("devready_store_test_" + std::to_string(rd()));
    fs::create_directories(dir_);
    file_ = dir_ / "environment";
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void WriteFile(const std::string& content) {
    std::ofstream out(file_, std::ios::binary);
    out << content;
  }

  [[nodiscard]] auto ReadFile() const -> std::string {
    std::ifstream in(file_, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  fs::path dir_;
  fs::path file_;
};

TEST_F(EnvironmentFileStoreTest, MissingFileReadsAsEmpty) {
  EnvironmentFileStore store(file_);

  auto value = store.Read();

  ASSERT_TRUE(value.has_value()) << value.error().Describe();
  EXPECT_EQ(*value, "");
}

TEST_F(EnvironmentFileStoreTest, ReadsQuotedAssignment) {
  WriteFile("# system env\nLANG=C.UTF-8\nPATH=\"/usr/bin:/bin\"\n");
  EnvironmentFileStore store(file_);

  auto value = store.Read();

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "/usr/bin:/bin");
}

TEST_F(EnvironmentFileStoreTest, ReadsExportedUnquotedAssignment) {
  WriteFile("export PATH=/usr/bin:/bin\n");
  EnvironmentFileStore store(file_);

  auto value = store.Read();

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "/usr/bin:/bin");
}

TEST_F(EnvironmentFileStoreTest, IgnoresOtherVariablesAndComments) {
  WriteFile("#PATH=/commented\nMYPATH=/other\nPATHX=/other\n");
  EnvironmentFileStore store(file_);

  auto value = store.Read();

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "");
}

TEST_F(EnvironmentFileStoreTest, WriteReplacesOnlyTheAssignment) {
  WriteFile("# system env\nLANG=C.UTF-8\nPATH=\"/usr/bin\"\nEDITOR=vi\n");
  EnvironmentFileStore store(file_);

  auto written = store.Write("/usr/bin:/opt/git/bin");

  ASSERT_TRUE(written.has_value()) << written.error().Describe();
  EXPECT_EQ(
      ReadFile(),
      "# system env\nLANG=C.UTF-8\nPATH=\"/usr/bin:/opt/git/bin\"\n"
      "EDITOR=vi\n");
  EXPECT_EQ(*store.Read(), "/usr/bin:/opt/git/bin");
}

TEST_F(EnvironmentFileStoreTest, WriteKeepsExportPrefix) {
  WriteFile("export PATH=/usr/bin");
  EnvironmentFileStore store(file_);

  ASSERT_TRUE(store.Write("/usr/bin:/opt/git/bin").has_value());

  EXPECT_EQ(ReadFile(), "export PATH=\"/usr/bin:/opt/git/bin\"");
}

TEST_F(EnvironmentFileStoreTest, WriteAppendsAssignmentWhenMissing) {
  WriteFile("LANG=C.UTF-8\n");
  EnvironmentFileStore store(file_);

  ASSERT_TRUE(store.Write("/opt/git/bin").has_value());

  EXPECT_EQ(ReadFile(), "LANG=C.UTF-8\nPATH=\"/opt/git/bin\"\n");
}

TEST_F(EnvironmentFileStoreTest, WriteCreatesMissingFile) {
  EnvironmentFileStore store(file_);

  ASSERT_TRUE(store.Write("/opt/git/bin").has_value());

  EXPECT_EQ(ReadFile(), "PATH=\"/opt/git/bin\"\n");
  EXPECT_FALSE(fs::exists(dir_ / "environment.devready.tmp"));
}

TEST_F(EnvironmentFileStoreTest, WriteIntoMissingDirectoryFails) {
  EnvironmentFileStore store(dir_ / "missing" / "environment");

  auto written = store.Write("/opt/git/bin");

  ASSERT_FALSE(written.has_value());
  EXPECT_NE(written.error().Describe().find("cannot write"), std::string::npos);
  EXPECT_FALSE(fs::exists(dir_ / "missing"));
}

TEST_F(EnvironmentFileStoreTest, FailedWriteLeavesExistingFileUnchanged) {
  const std::string original =
      "# system env\nexport PATH='/usr/bin:/bin'\nLANG=C.UTF-8";
  WriteFile(original);
  // A directory where the temporary file should go makes the write fail.
  fs::create_directories(dir_ / "environment.devready.tmp");
  EnvironmentFileStore store(file_);

  auto written = store.Write("/usr/bin:/bin:/opt/git/bin");

  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(ReadFile(), original);
  EXPECT_TRUE(fs::is_directory(dir_ / "environment.devready.tmp"));
  auto value = store.Read();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "/usr/bin:/bin");
}

TEST_F(EnvironmentFileStoreTest, CustomVariableName) {
  WriteFile("PATH=/usr/bin\nTOOLS_PATH=/opt/tools\n");
  EnvironmentFileStore store(file_, "TOOLS_PATH");

  auto value = store.Read();

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "/opt/tools");
  EXPECT_EQ(store.Location(), file_.string());
}

}  // namespace
}  // namespace devready::platform

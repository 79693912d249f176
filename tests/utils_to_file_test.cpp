#include <gtest/gtest.h>

#include "finagent/error.hpp"
#include "finagent/utils/to_file.hpp"
#include "support/temp_dir.hpp"

#include <fstream>
#include <sstream>

using namespace finagent::utils;

TEST(UtilsToFileTest, ReadAllConsumesStream) {
  std::istringstream stream(std::string(10000, 'a'));
  EXPECT_EQ(read_all(stream).size(), 10000u);
}

TEST(UtilsToFileTest, ToFileUsesBasenameUnlessOverridden) {
  finagent::testing::TempDir dir;
  auto path = dir.file("q1.csv");
  {
    std::ofstream out(path, std::ios::binary);
    out << "month,revenue\n";
  }

  auto source = to_file(path.string(), "text/csv");
  EXPECT_EQ(source.filename, "q1.csv");
  EXPECT_EQ(source.content_type, "text/csv");
  EXPECT_EQ(source.data, "month,revenue\n");

  auto renamed = to_file(path.string(), "text/csv", std::string("renamed.csv"));
  EXPECT_EQ(renamed.filename, "renamed.csv");
}

TEST(UtilsToFileTest, ToFileThrowsForMissingPath) {
  finagent::testing::TempDir dir;
  EXPECT_THROW(to_file(dir.file("absent.csv").string(), "text/csv"), finagent::FinAgentError);
}

TEST(UtilsToFileTest, GuessesSpreadsheetContentTypes) {
  EXPECT_EQ(spreadsheet_content_type("data/q1.csv"), std::optional<std::string>("text/csv"));
  EXPECT_EQ(spreadsheet_content_type("Q1.XLSX"),
            std::optional<std::string>("application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"));
  EXPECT_EQ(spreadsheet_content_type("old.xls"), std::optional<std::string>("application/vnd.ms-excel"));
  EXPECT_FALSE(spreadsheet_content_type("notes.txt").has_value());
  EXPECT_FALSE(spreadsheet_content_type("noextension").has_value());
}

TEST(UtilsToFileTest, RecognisesSpreadsheetContentTypes) {
  EXPECT_TRUE(is_spreadsheet_content_type("text/csv"));
  EXPECT_TRUE(is_spreadsheet_content_type("application/vnd.ms-excel"));
  EXPECT_FALSE(is_spreadsheet_content_type("application/pdf"));
}

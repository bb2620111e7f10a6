#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include "../src/core/csv_data_source.hpp"
#include "../src/core/errors.hpp"

using namespace strategy_sim;
namespace fs = std::filesystem;

class CsvDataSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("strategy_sim_csv_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& symbol, const std::string& content) {
        std::ofstream f(dir_ / (symbol + ".csv"));
        f << content;
    }

    fs::path dir_;
};

namespace {

const char* kHsi =
    "date,open,high,low,close,volume\n"
    "2024-01-02,100,101,99,100.5,1000\n"
    "2024-01-03,100.5,102,100,101.5,1100\n"
    "2024-01-04,101.5,103,101,102.5,1200\n"
    "2024-01-05,102.5,104,102,103.5,1300\n";

} // namespace

TEST_F(CsvDataSourceTest, FetchFiltersInclusiveRange) {
    write("HSI", kHsi);
    CsvDataSource source(dir_.string());
    auto bars = source.fetch_history("HSI", utils::make_date(2024, 1, 3), utils::make_date(2024, 1, 4));
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(utils::ts_to_date(bars[0].date), "2024-01-03");
    EXPECT_DOUBLE_EQ(bars[0].close, 101.5);
    EXPECT_EQ(utils::ts_to_date(bars[1].date), "2024-01-04");
    EXPECT_DOUBLE_EQ(bars[1].volume, 1200.0);
}

TEST_F(CsvDataSourceTest, EndBeforeStartIsUnavailable) {
    write("HSI", kHsi);
    CsvDataSource source(dir_.string());
    EXPECT_THROW(source.fetch_history("HSI", utils::make_date(2024, 1, 5), utils::make_date(2024, 1, 2)),
                 DataUnavailable);
}

TEST_F(CsvDataSourceTest, MissingFileIsUnavailable) {
    CsvDataSource source(dir_.string());
    EXPECT_THROW(source.fetch_history("NOPE", utils::make_date(2024, 1, 1), utils::make_date(2024, 12, 31)),
                 DataUnavailable);
}

TEST_F(CsvDataSourceTest, EmptyRangeIsUnavailable) {
    write("HSI", kHsi);
    CsvDataSource source(dir_.string());
    EXPECT_THROW(source.fetch_history("HSI", utils::make_date(2023, 1, 1), utils::make_date(2023, 12, 31)),
                 DataUnavailable);
}

TEST_F(CsvDataSourceTest, MalformedLinesSkipped) {
    write("HSI",
          "date,open,high,low,close,volume\n"
          "2024-01-02,100,101,99,100.5,1000\n"
          "2024-01-03,abc,102,100,101.5,1100\n"
          "2024-01-04,101.5,103\n"
          "\n"
          "2024-01-05,102.5,104,102,103.5,1300\r\n");
    auto bars = CsvDataSource::load_file((dir_ / "HSI.csv").string());
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(utils::ts_to_date(bars[1].date), "2024-01-05");
    EXPECT_DOUBLE_EQ(bars[1].volume, 1300.0);
}

TEST_F(CsvDataSourceTest, NonFiniteValuesSkippedAsMalformed) {
    write("HSI",
          "date,open,high,low,close,volume\n"
          "2024-01-02,100,101,99,100.5,1000\n"
          "2024-01-03,100.5,102,100,nan,1100\n"
          "2024-01-04,101.5,inf,101,102.5,1200\n"
          "2024-01-05,102.5,104,102,103.5,1300\n");
    auto bars = CsvDataSource::load_file((dir_ / "HSI.csv").string());
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(utils::ts_to_date(bars[0].date), "2024-01-02");
    EXPECT_EQ(utils::ts_to_date(bars[1].date), "2024-01-05");
    for (const auto& bar : bars) EXPECT_TRUE(std::isfinite(bar.close));
}

TEST_F(CsvDataSourceTest, HeaderlessFileAccepted) {
    write("HSI", "2024-01-02,100,101,99,100.5,1000\n");
    auto bars = CsvDataSource::load_file((dir_ / "HSI.csv").string());
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].open, 100.0);
}

TEST_F(CsvDataSourceTest, UnsortedRowsAreSorted) {
    write("HSI",
          "date,open,high,low,close,volume\n"
          "2024-01-04,3,3,3,3,1\n"
          "2024-01-02,1,1,1,1,1\n"
          "2024-01-03,2,2,2,2,1\n");
    auto bars = CsvDataSource::load_file((dir_ / "HSI.csv").string());
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_DOUBLE_EQ(bars[0].close, 1.0);
    EXPECT_DOUBLE_EQ(bars[1].close, 2.0);
    EXPECT_DOUBLE_EQ(bars[2].close, 3.0);
}

TEST_F(CsvDataSourceTest, DuplicateDatesRejected) {
    write("HSI",
          "date,open,high,low,close,volume\n"
          "2024-01-02,1,1,1,1,1\n"
          "2024-01-02,2,2,2,2,1\n");
    CsvDataSource source(dir_.string());
    EXPECT_THROW(source.fetch_history("HSI", utils::make_date(2024, 1, 1), utils::make_date(2024, 1, 31)),
                 InvalidInput);
}

TEST_F(CsvDataSourceTest, PathForJoinsDirectoryAndSymbol) {
    CsvDataSource source("prices");
    EXPECT_EQ(source.path_for("HSI"), "prices/HSI.csv");
    CsvDataSource bare("");
    EXPECT_EQ(bare.path_for("HSI"), "HSI.csv");
}

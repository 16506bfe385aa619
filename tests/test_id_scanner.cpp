#include <gtest/gtest.h>

#include "../texharvest_cli/src/utils/id_scanner.hpp"
#include "test_support.hpp"

#include <fstream>

using namespace texharvest;
using namespace texharvest::test_support;

TEST(IdScanner, MergesPositionalAndFileKeepingOrder) {
    const auto dir = make_test_dir("ids");
    const auto list = dir.path() / "ids.txt";
    {
        std::ofstream out(list);
        out << "# batch one\n"
            << "2404.04895\n"
            << "\n"
            << "  hep-th/9901001   # old style\n"
            << "2301.00001\n";
    }

    const auto ids = collect_identifiers({"2301.00001", "1234.5678"}, list);
    ASSERT_TRUE(ids.has_value());
    const std::vector<std::string> expected{"2301.00001", "1234.5678", "2404.04895", "hep-th/9901001"};
    EXPECT_EQ(*ids, expected);
}

TEST(IdScanner, InvalidIdentifiersArePassedThrough) {
    const auto ids = collect_identifiers({"not-an-id", "2404.04895"}, {});
    ASSERT_TRUE(ids.has_value());
    EXPECT_EQ(ids->size(), 2u);
    EXPECT_EQ(ids->front(), "not-an-id");
}

TEST(IdScanner, MissingFileIsAnError) {
    ScopedLogCapture logs;
    const auto ids = collect_identifiers({}, "/nonexistent/texharvest/ids.txt");
    EXPECT_FALSE(ids.has_value());
    EXPECT_TRUE(logs.contains("id_scanner", "Can't read identifier list"));
}

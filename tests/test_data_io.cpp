/** test_data_io.cpp
    CSV and KEEL loaders, including the unlabeled marker and the label shift.
*/

#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include "functions/io/DataIO.hpp"
#include "pipeline/DataSplit.hpp"

#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::string writeTemp(const std::string& name, const std::string& content)
{
    const std::string path = "semitree_" + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

BOOST_AUTO_TEST_CASE( test_read_csv_basic )
{
    const auto path = writeTemp("basic.csv",
        "f1,f2,label\n"
        "1.0,2.0,0\n"
        "3.0,4.0,1\n"
        "\n"
        "5.0,6.0,unlabeled\n");

    DataIO io;
    int rowLength = 0;
    auto data = io.readCSV(path, rowLength);
    BOOST_CHECK_EQUAL(rowLength, 2);
    BOOST_REQUIRE_EQUAL(data.second.size(), 3u);
    BOOST_CHECK_EQUAL(data.second[0], 0);
    BOOST_CHECK_EQUAL(data.second[1], 1);
    BOOST_CHECK_EQUAL(data.second[2], kUnlabeled);
    BOOST_CHECK_EQUAL(data.first.size(), 6u);
    BOOST_CHECK_EQUAL(data.first[4], 5.0);
    BOOST_CHECK(io.validateData(data.first, data.second, rowLength));
    std::remove(path.c_str());
}

BOOST_AUTO_TEST_CASE( test_read_csv_secure_shift )
{
    const auto path = writeTemp("secure.csv",
        "a,label\n"
        "0.5,-1\n"
        "1.5,1\n"
        "2.5,unlabeled\n");

    DataIO io;
    int rowLength = 0;
    auto secured = io.readCSV(path, rowLength, true);
    BOOST_CHECK_EQUAL(secured.second[0], 1);
    BOOST_CHECK_EQUAL(secured.second[1], 3);
    BOOST_CHECK_EQUAL(secured.second[2], kUnlabeled);

    // 不做平移时真实类别 -1 与哨兵无法区分
    auto raw = io.readCSV(path, rowLength, false);
    BOOST_CHECK_EQUAL(raw.second[0], -1);
    BOOST_CHECK_EQUAL(raw.second[1], 1);
    std::remove(path.c_str());
}

BOOST_AUTO_TEST_CASE( test_read_csv_target_column )
{
    const auto path = writeTemp("target.csv",
        "label,x,y\n"
        "2,0.1,0.2\n"
        "4,0.3,0.4\n");

    DataIO io;
    int rowLength = 0;
    auto data = io.readCSV(path, rowLength, true, 0);
    BOOST_CHECK_EQUAL(rowLength, 2);
    BOOST_CHECK_EQUAL(data.second[1], 4);
    BOOST_CHECK_CLOSE(data.first[2], 0.3, 1e-9);
    std::remove(path.c_str());
}

BOOST_AUTO_TEST_CASE( test_read_csv_errors )
{
    DataIO io;
    int rowLength = 0;
    BOOST_CHECK_THROW(io.readCSV("semitree_missing_file.csv", rowLength), std::runtime_error);

    const auto bad = writeTemp("bad.csv", "a,label\nabc,1\n");
    BOOST_CHECK_THROW(io.readCSV(bad, rowLength), std::runtime_error);
    std::remove(bad.c_str());

    const auto ragged = writeTemp("ragged.csv", "a,b,label\n1,2,0\n1,0\n");
    BOOST_CHECK_THROW(io.readCSV(ragged, rowLength), std::runtime_error);
    std::remove(ragged.c_str());

    const auto frac = writeTemp("frac.csv", "a,label\n1,0.5\n");
    BOOST_CHECK_THROW(io.readCSV(frac, rowLength), std::runtime_error);
    std::remove(frac.c_str());
}

BOOST_AUTO_TEST_CASE( test_read_keel_nominal )
{
    const auto path = writeTemp("toy.dat",
        "@relation toy\n"
        "@attribute width real [0.0, 10.0]\n"
        "@attribute color {red, green}\n"
        "@attribute Class {neg, pos}\n"
        "@inputs width, color\n"
        "@outputs Class\n"
        "@data\n"
        "1.5, green, pos\n"
        "2.5, red, neg\n"
        "3.5, red, unlabeled\n");

    DataIO io;
    int rowLength = 0;
    auto data = io.readKEEL(path, rowLength);
    BOOST_CHECK_EQUAL(rowLength, 2);
    BOOST_REQUIRE_EQUAL(data.second.size(), 3u);
    BOOST_CHECK_EQUAL(data.second[0], 1);
    BOOST_CHECK_EQUAL(data.second[1], 0);
    BOOST_CHECK_EQUAL(data.second[2], kUnlabeled);
    // 名义特征按声明顺序编码
    BOOST_CHECK_EQUAL(data.first[1], 1.0);
    BOOST_CHECK_EQUAL(data.first[3], 0.0);
    std::remove(path.c_str());
}

BOOST_AUTO_TEST_CASE( test_read_keel_undeclared_value )
{
    const auto path = writeTemp("undeclared.dat",
        "@attribute x real\n"
        "@attribute Class {a, b}\n"
        "@data\n"
        "1.0, c\n");
    DataIO io;
    int rowLength = 0;
    BOOST_CHECK_THROW(io.readKEEL(path, rowLength), std::runtime_error);
    std::remove(path.c_str());
}

BOOST_AUTO_TEST_CASE( test_secure_labels_only_with_minus_one )
{
    std::vector<int> labels = {0, 1, kUnlabeled};
    DataIO::secureLabels(labels, {0, 0, 1});
    BOOST_CHECK_EQUAL(labels[0], 0);
    BOOST_CHECK_EQUAL(labels[1], 1);
    BOOST_CHECK_EQUAL(labels[2], kUnlabeled);
}

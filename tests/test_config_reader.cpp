#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include "polybasis/config_reader.h"

using namespace polybasis;

namespace {

std::string temp_path(const std::string& name) {
    return ::testing::TempDir() + "polybasis_" + name;
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream ofs(path);
    ASSERT_TRUE(ofs.is_open()) << "Cannot create " << path;
    ofs << content;
}

} // namespace

TEST(ConfigReaderTest, ReadsPlainTextConfig) {
    std::cout << "Testing plain text config...\n";

    std::string path = temp_path("plain.txt");
    write_file(path,
               "# comment\n"
               "interval_start = 0\n"
               "interval_end = 2\n"
               "verify_tolerance = 1e-8\n"
               "\n"
               "nodes_count = 3\n"
               "0\n"
               "1.0   # middle node\n"
               "2\n"
               "eval_points_count = 2\n"
               "0.5\n"
               "1.5\n"
               "unknown_key = 42\n");

    // Комментарий после числа не поддерживается
    EXPECT_THROW(ConfigReader::read_from_file(path), std::runtime_error);

    write_file(path,
               "# comment\n"
               "interval_start = 0\n"
               "interval_end = 2\n"
               "verify_tolerance = 1e-8\n"
               "\n"
               "nodes_count = 3\n"
               "0\n"
               "1.0\n"
               "2\n"
               "eval_points_count = 2\n"
               "0.5\n"
               "1.5\n"
               "unknown_key = 42\n");

    BasisConfig config = ConfigReader::read_from_file(path);
    EXPECT_DOUBLE_EQ(config.interval_start, 0.0);
    EXPECT_DOUBLE_EQ(config.interval_end, 2.0);
    EXPECT_DOUBLE_EQ(config.verify_tolerance, 1e-8);
    ASSERT_EQ(config.nodes.size(), 3u);
    EXPECT_DOUBLE_EQ(config.nodes[1], 1.0);
    ASSERT_EQ(config.evaluation_points.size(), 2u);
    EXPECT_DOUBLE_EQ(config.evaluation_points[1], 1.5);

    std::remove(path.c_str());
}

TEST(ConfigReaderTest, PlainTextErrors) {
    std::string path = temp_path("bad.txt");

    write_file(path, "nodes_count = 3\n0.1\n0.2\n");
    EXPECT_THROW(ConfigReader::read_from_file(path), std::runtime_error);

    write_file(path, "interval_start -1\n");
    EXPECT_THROW(ConfigReader::read_from_file(path), std::runtime_error);

    write_file(path, "interval_end = abc\n");
    EXPECT_THROW(ConfigReader::read_from_file(path), std::runtime_error);

    write_file(path, "nodes_count = -2\n");
    EXPECT_THROW(ConfigReader::read_from_file(path), std::runtime_error);

    std::remove(path.c_str());

    EXPECT_THROW(ConfigReader::read_from_file(temp_path("does_not_exist.txt")), std::runtime_error);
}

TEST(ConfigReaderTest, WriteReadRoundTrip) {
    std::cout << "Testing config write/read...\n";

    BasisConfig config;
    config.interval_start = -0.5;
    config.interval_end = 3.25;
    config.verify_tolerance = 1e-9;
    config.nodes = {-0.5, 0.1, 1.0 / 3.0, 3.25};
    config.evaluation_points = {0.0, 2.0};

    std::string path = temp_path("roundtrip.txt");
    ConfigReader::write_to_file(config, path);
    BasisConfig loaded = ConfigReader::read_from_file(path);

    EXPECT_DOUBLE_EQ(loaded.interval_start, config.interval_start);
    EXPECT_DOUBLE_EQ(loaded.interval_end, config.interval_end);
    EXPECT_DOUBLE_EQ(loaded.verify_tolerance, config.verify_tolerance);
    EXPECT_EQ(loaded.nodes, config.nodes);
    EXPECT_EQ(loaded.evaluation_points, config.evaluation_points);

    std::remove(path.c_str());
}

TEST(ConfigReaderTest, ReadsNodesCsv) {
    std::cout << "Testing nodes CSV...\n";

    std::string path = temp_path("nodes.csv");
    write_file(path, "x;weight\n# first node\n-1;1\n0.25;1\n\n1;1\n");

    std::vector<double> nodes = ConfigReader::read_nodes_csv(path);
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_DOUBLE_EQ(nodes[0], -1.0);
    EXPECT_DOUBLE_EQ(nodes[1], 0.25);
    EXPECT_DOUBLE_EQ(nodes[2], 1.0);

    // Без заголовка
    write_file(path, "0.5\n0.75\n");
    nodes = ConfigReader::read_nodes_csv(path);
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_DOUBLE_EQ(nodes[0], 0.5);

    write_file(path, "x\n0.5\nnot-a-number\n");
    EXPECT_THROW(ConfigReader::read_nodes_csv(path), std::runtime_error);

    std::remove(path.c_str());
}

TEST(ConfigReaderTest, ReadsYamlWithInlineNodes) {
    std::cout << "Testing YAML config...\n";

    std::string path = temp_path("inline.yaml");
    write_file(path,
               "basis:\n"
               "  interval:\n"
               "    a: -2.0\n"
               "    b: 2.0\n"
               "  nodes: [-2.0, -0.5, 1.0, 2.0]\n"
               "  verify_tolerance: 1.0e-11\n"
               "evaluation:\n"
               "  points: [0.0, 1.5]\n");

    BasisConfig config = ConfigReader::read_from_yaml(path);
    EXPECT_DOUBLE_EQ(config.interval_start, -2.0);
    EXPECT_DOUBLE_EQ(config.interval_end, 2.0);
    EXPECT_DOUBLE_EQ(config.verify_tolerance, 1e-11);
    ASSERT_EQ(config.nodes.size(), 4u);
    EXPECT_DOUBLE_EQ(config.nodes[1], -0.5);
    ASSERT_EQ(config.evaluation_points.size(), 2u);
    EXPECT_TRUE(config.nodes_file.empty());

    std::remove(path.c_str());
}

TEST(ConfigReaderTest, YamlDefaultsAndCsvSource) {
    std::string csv_path = temp_path("yaml_nodes.csv");
    write_file(csv_path, "x\n-1\n1\n");

    std::string path = temp_path("csv.yaml");
    write_file(path,
               "basis:\n"
               "  nodes: [0.0]\n"
               "data_sources:\n"
               "  nodes: polybasis_yaml_nodes.csv\n");

    BasisConfig config = ConfigReader::read_from_yaml(path);
    EXPECT_DOUBLE_EQ(config.interval_start, -1.0);
    EXPECT_DOUBLE_EQ(config.interval_end, 1.0);
    EXPECT_DOUBLE_EQ(config.verify_tolerance, 1e-10);
    EXPECT_EQ(config.nodes_file, csv_path);
    ASSERT_EQ(config.nodes.size(), 2u);
    EXPECT_DOUBLE_EQ(config.nodes[0], -1.0);
    EXPECT_DOUBLE_EQ(config.nodes[1], 1.0);

    std::remove(path.c_str());
    std::remove(csv_path.c_str());
}

TEST(ConfigReaderTest, YamlErrors) {
    std::string path = temp_path("bad.yaml");

    write_file(path, "evaluation:\n  points: [0.0]\n");
    EXPECT_THROW(ConfigReader::read_from_yaml(path), std::runtime_error);

    write_file(path, "basis:\n  nodes: [0.0, oops]\n");
    EXPECT_THROW(ConfigReader::read_from_yaml(path), std::runtime_error);

    write_file(path, "basis: [unterminated\n");
    EXPECT_THROW(ConfigReader::read_from_yaml(path), std::runtime_error);

    std::remove(path.c_str());

    EXPECT_THROW(ConfigReader::read_from_yaml(temp_path("missing.yaml")), std::runtime_error);
}

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

#include "ConfigParser.hpp"
#include "TestSupport.hpp"

static std::vector<ServerConfig> parseText(const std::string &text) {
    std::istringstream in(text);
    ConfigParser parser;
    return parser.parse(in);
}

TEST(ConfigParserTest, MinimalServerUsesDefaults) {
    std::vector<ServerConfig> cfgs = parseText(
        "server {\n"
        "    listen 8080;\n"
        "    root ./www;\n"
        "}\n");

    ASSERT_EQ(1u, cfgs.size());
    const ServerConfig &c = cfgs[0];
    EXPECT_EQ(8080, c.port);
    EXPECT_EQ("./www", c.root);
    EXPECT_EQ("0.0.0.0", c.host);
    EXPECT_EQ("Michael's very own server", c.serverName);
    EXPECT_EQ("text/html", c.contentType);
    EXPECT_EQ("TestBase.html", c.templateFile);
    EXPECT_EQ("Test.html", c.outputFile);
    EXPECT_EQ("notFound.html", c.notFoundFile);
    EXPECT_TRUE(c.materialize);
    EXPECT_EQ(0, c.readTimeoutMs);
    EXPECT_EQ(8192u, c.maxLineLength);
    EXPECT_EQ("info", c.logLevel);
}

TEST(ConfigParserTest, AllDirectives) {
    std::vector<ServerConfig> cfgs = parseText(
        "# comment\n"
        "server {\n"
        "    listen        9090;\n"
        "    host          127.0.0.1;\n"
        "    root          /srv/www;\n"
        "    server_name   My  Test Server;\n"
        "    content_type  auto;\n"
        "    template      base.html;\n"
        "    output        out.html;\n"
        "    not_found     404.html;\n"
        "    materialize   off;\n"
        "    read_timeout  2500;\n"
        "    max_line_length 1024;\n"
        "    log_level     warning;\n"
        "}\n");

    ASSERT_EQ(1u, cfgs.size());
    const ServerConfig &c = cfgs[0];
    EXPECT_EQ(9090, c.port);
    EXPECT_EQ("127.0.0.1", c.host);
    EXPECT_EQ("/srv/www", c.root);
    EXPECT_EQ("My  Test Server", c.serverName);
    EXPECT_EQ("auto", c.contentType);
    EXPECT_EQ("base.html", c.templateFile);
    EXPECT_EQ("out.html", c.outputFile);
    EXPECT_EQ("404.html", c.notFoundFile);
    EXPECT_FALSE(c.materialize);
    EXPECT_EQ(2500, c.readTimeoutMs);
    EXPECT_EQ(1024u, c.maxLineLength);
    EXPECT_EQ("warning", c.logLevel);
}

TEST(ConfigParserTest, MultipleServerBlocksAreIndependent) {
    std::vector<ServerConfig> cfgs = parseText(
        "server {\n listen 8080;\n root a;\n materialize off;\n}\n"
        "server {\n listen 8081;\n root b;\n}\n");

    ASSERT_EQ(2u, cfgs.size());
    EXPECT_EQ(8080, cfgs[0].port);
    EXPECT_FALSE(cfgs[0].materialize);
    EXPECT_EQ(8081, cfgs[1].port);
    EXPECT_EQ("b", cfgs[1].root);
    EXPECT_TRUE(cfgs[1].materialize);
}

TEST(ConfigParserTest, RejectsBrokenFiles) {
    EXPECT_THROW(parseText(""), std::runtime_error);
    EXPECT_THROW(parseText("listen 80;\n"), std::runtime_error);
    EXPECT_THROW(parseText("server\n{\n listen 80;\n root a;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80;\n root a;\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80\n root a;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n root a;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80;\n root a;\n bogus 1;\n}\n"), std::runtime_error);
}

TEST(ConfigParserTest, RejectsBadValues) {
    EXPECT_THROW(parseText("server {\n listen abc;\n root a;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 70000;\n root a;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80;\n root a;\n materialize yes;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80;\n root a;\n read_timeout -5;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80;\n root a;\n read_timeout 3000000000;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80;\n root a;\n read_timeout 99999999999999999999999;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80;\n root a;\n max_line_length 0;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80;\n root a;\n log_level loud;\n}\n"), std::runtime_error);
    EXPECT_THROW(parseText("server {\n listen 80;\n root a b;\n}\n"), std::runtime_error);
}

TEST(ConfigParserTest, AcceptsLargestTimeout) {
    std::vector<ServerConfig> cfgs =
        parseText("server {\n listen 80;\n root a;\n read_timeout 2147483647;\n}\n");
    ASSERT_EQ(1u, cfgs.size());
    EXPECT_EQ(2147483647, cfgs[0].readTimeoutMs);
}

TEST(ConfigParserTest, ReadsFromFile) {
    TempDir dir;
    dir.write("test.conf", "server {\n listen 8088;\n root .;\n}\n");

    ConfigParser parser;
    std::vector<ServerConfig> cfgs = parser.getServerConfigs(dir.file("test.conf"));
    ASSERT_EQ(1u, cfgs.size());
    EXPECT_EQ(8088, cfgs[0].port);
}

TEST(ConfigParserTest, MissingFileThrows) {
    ConfigParser parser;
    EXPECT_THROW(parser.getServerConfigs("/nonexistent/webworker.conf"), std::runtime_error);
}

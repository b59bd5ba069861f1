// merge_whitespace.cpp/test/cli_test.cpp
#include <gtest/gtest.h>

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#ifndef MERGE_WHITESPACE_CLI_PATH
#error "MERGE_WHITESPACE_CLI_PATH is not defined"
#endif

namespace {

struct CliResult {
    std::string output;
    int exitCode;
};

// POSIX shell single-quote escaping: ' -> '"'"'
std::string quoteShell(std::string const& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out += "'";
    return out;
}

CliResult runCli(std::vector<std::string> const& args, std::string const& stdinData) {
    char tmpl[] = "/tmp/merge_whitespace_cli_inputXXXXXX";
    int fd = mkstemp(tmpl);
    if (fd == -1) {
        throw std::runtime_error("Failed to create temp file");
    }
    auto const written = write(fd, stdinData.data(), stdinData.size());
    close(fd);
    std::string tempPath = tmpl;
    if (written != static_cast<ssize_t>(stdinData.size())) {
        unlink(tempPath.c_str());
        throw std::runtime_error("Failed to write temp file");
    }

    std::string cmd = quoteShell(MERGE_WHITESPACE_CLI_PATH);
    for (auto const& a : args) {
        cmd.push_back(' ');
        cmd += quoteShell(a);
    }
    cmd += " < " + quoteShell(tempPath) + " 2>/dev/null";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        unlink(tempPath.c_str());
        throw std::runtime_error(std::string("Failed to run CLI: ") + std::strerror(errno) + " (" + cmd + ")");
    }
    std::string output;
    char buf[256];
    std::size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) {
        output.append(buf, n);
    }
    int status = pclose(pipe);
    unlink(tempPath.c_str());
    return CliResult{output, WIFEXITED(status) ? WEXITSTATUS(status) : -1};
}

TEST(CliTests, ReadsFromStdin) {
    CliResult result = runCli({}, "  Hello     World!\r\n      How        are         you?\n");
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "Hello World! How are you?");
}

TEST(CliTests, ReadsFromFile) {
    char const* path = "/tmp/merge_whitespace_cli_file.txt";
    {
        FILE* f = fopen(path, "w");
        ASSERT_NE(f, nullptr);
        fputs("query {\n  name: \"a   b\"\n}\n", f);
        fclose(f);
    }
    CliResult result = runCli({"--file", path, "--quote-char", "\""}, "");
    unlink(path);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "query { name: \"a   b\" }");
}

TEST(CliTests, AppliesEscapeChar) {
    CliResult result = runCli({"--quote-char", "\"", "--escape-char", "\\"}, "a   \\\"  b   \"c   d\"");
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "a \\\" b \"c   d\"");
}

TEST(CliTests, AcceptsMultibyteQuoteChar) {
    CliResult result = runCli({"--quote-char", "\xC2\xAB"}, "x   \xC2\xAB  y  \xC2\xAB   z");
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "x \xC2\xAB  y  \xC2\xAB z");
}

TEST(CliTests, RejectsMultiCharacterOption) {
    CliResult result = runCli({"--quote-char", "ab"}, "a  b");
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_EQ(result.output, "");
}

TEST(CliTests, RejectsEmptyOption) {
    CliResult result = runCli({"--escape-char", ""}, "a  b");
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_EQ(result.output, "");
}

TEST(CliTests, RejectsUnknownArgument) {
    CliResult result = runCli({"--fenced"}, "a  b");
    EXPECT_EQ(result.exitCode, 1);
}

TEST(CliTests, MissingFileFails) {
    CliResult result = runCli({"--file", "/nonexistent/merge_whitespace_input.txt"}, "");
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_EQ(result.output, "");
}

TEST(CliTests, VerboseDoesNotChangeOutput) {
    CliResult result = runCli({"--verbose"}, " a \n b ");
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "a b");
}

} // namespace

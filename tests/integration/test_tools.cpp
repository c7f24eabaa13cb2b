#include <gtest/gtest.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <sys/wait.h>

#include "pktlib/packet/codec.hpp"

using namespace pktlib::packet;

#ifndef PKTLIB_PKT_GEN_PATH
#error "PKTLIB_PKT_GEN_PATH must point at the pkt_gen binary"
#endif
#ifndef PKTLIB_PKT_DECODE_PATH
#error "PKTLIB_PKT_DECODE_PATH must point at the pkt_decode binary"
#endif

// pkt_gen / pkt_decode を実プロセスとして起動し、終了コードと出力を確認する
class ToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        // テストごとに別ディレクトリ（ctest -j で並列実行される）
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = std::filesystem::temp_directory_path() / ("pktlib_tools_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
        for (const char* v : kEnvVars) ::unsetenv(v);
    }

    void TearDown() override {
        for (const char* v : kEnvVars) ::unsetenv(v);
        std::filesystem::remove_all(test_dir);
    }

    struct RunResult {
        int exit_code = -1;
        std::string out;
        std::string err;
    };

    RunResult run(const std::string& exe, const std::string& args) const {
        auto out_path = test_dir / "stdout.txt";
        auto err_path = test_dir / "stderr.txt";
        std::string cmd = quote(exe) + " " + args + " > " + quote(out_path.string()) +
                          " 2> " + quote(err_path.string());
        int status = std::system(cmd.c_str());
        RunResult r;
        if (status != -1 && WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
        r.out = read_text(out_path);
        r.err = read_text(err_path);
        return r;
    }

    RunResult gen(const std::string& args) const { return run(PKTLIB_PKT_GEN_PATH, args); }
    RunResult decode(const std::string& args) const { return run(PKTLIB_PKT_DECODE_PATH, args); }

    std::string path_arg(const std::string& name) const { return quote((test_dir / name).string()); }

    std::vector<std::uint8_t> read_bytes(const std::string& name) const {
        std::ifstream ifs(test_dir / name, std::ios::binary);
        return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    }

    void write_bytes(const std::string& name, const std::vector<std::uint8_t>& bytes) const {
        std::ofstream ofs(test_dir / name, std::ios::binary);
        ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    void write_text(const std::string& name, const std::string& text) const {
        std::ofstream ofs(test_dir / name);
        ofs << text;
    }

    Packet decode_file(const std::string& name) const {
        auto bytes = read_bytes(name);
        auto res = decode_packet(bytes);
        EXPECT_TRUE(res) << res.error().message();
        return res ? res.value() : Packet();
    }

    std::filesystem::path test_dir;

private:
    static constexpr const char* kEnvVars[] = {
        "PKTLIB_LOG_LEVEL", "PKTLIB_LOG_FILE",
        "PKTLIB_PACKET_DEFAULT_TYPE", "PKTLIB_PACKET_DEFAULT_SENDER",
    };

    static std::string quote(const std::string& s) { return "'" + s + "'"; }

    static std::string read_text(const std::filesystem::path& p) {
        std::ifstream ifs(p);
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }
};

TEST_F(ToolsTest, GenerateThenDecode) {
    auto g = gen("--type 1 --seq 42 --sender 12345 --payload-hex 0102030405 --out " + path_arg("a.bin"));
    ASSERT_EQ(g.exit_code, 0) << g.err;
    EXPECT_NE(g.out.find("wrote 26 bytes"), std::string::npos);
    EXPECT_EQ(read_bytes("a.bin").size(), 26u);

    auto d = decode(path_arg("a.bin") + " --verify");
    ASSERT_EQ(d.exit_code, 0) << d.err;
    EXPECT_NE(d.out.find("\"message_type\": 1"), std::string::npos);
    EXPECT_NE(d.out.find("\"sequence\": 42"), std::string::npos);
    EXPECT_NE(d.out.find("\"sender_id\": 12345"), std::string::npos);
    EXPECT_NE(d.out.find("\"payload_size\": 5"), std::string::npos);
    EXPECT_NE(d.out.find("\"checksum\": 15"), std::string::npos);
    EXPECT_NE(d.out.find("\"checksum_valid\": true"), std::string::npos);
}

TEST_F(ToolsTest, TypeAndSenderFallBackToConfig) {
    write_text("cfg.json", R"({"packet": {"default_type": 7, "default_sender": 99}})");

    auto g = gen("--config " + path_arg("cfg.json") + " --out " + path_arg("cfg.bin"));
    ASSERT_EQ(g.exit_code, 0) << g.err;
    Packet p = decode_file("cfg.bin");
    EXPECT_EQ(p.message_type(), 7);
    EXPECT_EQ(p.sender_id(), 99u);
    EXPECT_TRUE(p.payload().empty());

    // コマンドライン指定が優先
    g = gen("--type 2 --sender 3 --config " + path_arg("cfg.json") + " --out " + path_arg("cli.bin"));
    ASSERT_EQ(g.exit_code, 0) << g.err;
    p = decode_file("cli.bin");
    EXPECT_EQ(p.message_type(), 2);
    EXPECT_EQ(p.sender_id(), 3u);
}

TEST_F(ToolsTest, EnvironmentOverridesConfigDefaults) {
    write_text("cfg.json", R"({"packet": {"default_type": 7, "default_sender": 99}})");
    ::setenv("PKTLIB_PACKET_DEFAULT_SENDER", "555", 1);
    ::setenv("PKTLIB_PACKET_DEFAULT_TYPE", "0x10", 1);

    auto g = gen("--config " + path_arg("cfg.json") + " --out " + path_arg("env.bin"));
    ASSERT_EQ(g.exit_code, 0) << g.err;
    Packet p = decode_file("env.bin");
    EXPECT_EQ(p.message_type(), 16);
    EXPECT_EQ(p.sender_id(), 555u);
}

TEST_F(ToolsTest, NegativeDefaultSenderIsRejected) {
    ::setenv("PKTLIB_PACKET_DEFAULT_SENDER", "-1", 1);
    auto g = gen("--out " + path_arg("neg.bin"));
    EXPECT_EQ(g.exit_code, 2);
    EXPECT_NE(g.err.find("packet.default_sender out of range"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(test_dir / "neg.bin"));

    // 明示指定があれば既定値は参照しない
    g = gen("--sender 5 --out " + path_arg("explicit.bin"));
    ASSERT_EQ(g.exit_code, 0) << g.err;
    EXPECT_EQ(decode_file("explicit.bin").sender_id(), 5u);
}

TEST_F(ToolsTest, OutOfRangeDefaultTypeIsRejected) {
    write_text("cfg.json", R"({"packet": {"default_type": 300}})");
    auto g = gen("--config " + path_arg("cfg.json") + " --out " + path_arg("t.bin"));
    EXPECT_EQ(g.exit_code, 2);
    EXPECT_FALSE(std::filesystem::exists(test_dir / "t.bin"));
}

TEST_F(ToolsTest, VerifyExitsThreeOnChecksumMismatch) {
    ASSERT_EQ(gen("--type 1 --payload-hex 0102030405 --out " + path_arg("c.bin")).exit_code, 0);
    auto bytes = read_bytes("c.bin");
    ASSERT_EQ(bytes.size(), kHeaderSize + 5);
    bytes[offsets::kChecksum] ^= 0xFFu;
    write_bytes("c.bin", bytes);

    // 検証なしでは壊れたチェックサムでもデコードできる
    auto plain = decode(path_arg("c.bin"));
    EXPECT_EQ(plain.exit_code, 0) << plain.err;
    EXPECT_EQ(plain.out.find("checksum_valid"), std::string::npos);

    auto verified = decode(path_arg("c.bin") + " --verify");
    EXPECT_EQ(verified.exit_code, 3);
    EXPECT_NE(verified.out.find("\"checksum_valid\": false"), std::string::npos);
}

TEST_F(ToolsTest, DecodeErrorsExitOne) {
    ASSERT_EQ(gen("--payload-hex 0102030405 --out " + path_arg("d.bin")).exit_code, 0);
    auto bytes = read_bytes("d.bin");

    write_bytes("truncated.bin", std::vector<std::uint8_t>(bytes.begin(), bytes.end() - 1));
    auto d = decode(path_arg("truncated.bin"));
    EXPECT_EQ(d.exit_code, 1);
    EXPECT_NE(d.err.find("payload size mismatch"), std::string::npos);
    EXPECT_TRUE(d.out.empty());

    write_bytes("short.bin", std::vector<std::uint8_t>(bytes.begin(), bytes.begin() + 10));
    d = decode(path_arg("short.bin"));
    EXPECT_EQ(d.exit_code, 1);
    EXPECT_NE(d.err.find("insufficient bytes"), std::string::npos);

    d = decode(path_arg("missing.bin"));
    EXPECT_EQ(d.exit_code, 1);
    EXPECT_NE(d.err.find("failed to read file"), std::string::npos);
}

TEST_F(ToolsTest, UsageErrorsExitTwo) {
    EXPECT_EQ(gen("").exit_code, 2);
    EXPECT_EQ(gen("--type 256 --out " + path_arg("u.bin")).exit_code, 2);
    EXPECT_EQ(gen("--sender -3 --out " + path_arg("u.bin")).exit_code, 2);
    EXPECT_EQ(gen("--payload-hex 0g --out " + path_arg("u.bin")).exit_code, 2);
    EXPECT_EQ(gen("--config " + path_arg("none.json") + " --out " + path_arg("u.bin")).exit_code, 2);
    EXPECT_FALSE(std::filesystem::exists(test_dir / "u.bin"));

    EXPECT_EQ(decode("").exit_code, 2);
    EXPECT_EQ(decode("--bogus").exit_code, 2);
    EXPECT_EQ(decode(path_arg("a.bin") + " " + path_arg("b.bin")).exit_code, 2);
}

TEST_F(ToolsTest, UnwritableOutputExitsOne) {
    auto g = gen("--out " + path_arg("no_such_dir/pkt.bin"));
    EXPECT_EQ(g.exit_code, 1);
    EXPECT_NE(g.err.find("failed to write"), std::string::npos);
}

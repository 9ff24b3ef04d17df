#include <cli/cli_common.hpp>
#include <text/file_registry.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace voxlasm;
namespace fs = std::filesystem;

namespace {

// Owns argv storage for a simulated command line
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() const { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("voxlasm_cli_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& contents) {
        fs::path path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path.string();
    }

    fs::path dir_;
};

}  // namespace

TEST(CliArgs, ParsesCommonOptions) {
    Args args{"voxlasm", "tokenize", "prog.vasm", "-o", "out.json", "-n", "signed", "-v"};
    auto [ctx, next] = cli::parse_common_args(args.argc(), args.argv(), 2);

    EXPECT_EQ(next, args.argc());
    ASSERT_EQ(ctx.input_paths.size(), 1u);
    EXPECT_EQ(ctx.input_paths[0], "prog.vasm");
    EXPECT_EQ(ctx.output_path, "out.json");
    EXPECT_EQ(ctx.numeric_mode, lexer::NumericMode::Signed);
    EXPECT_TRUE(ctx.verbose);
    EXPECT_FALSE(ctx.help);
    EXPECT_FALSE(ctx.config_path.has_value());
}

TEST(CliArgs, RejectsBadInput) {
    Args unknown{"voxlasm", "check", "--frobnicate"};
    EXPECT_THROW(cli::parse_common_args(unknown.argc(), unknown.argv(), 2), std::runtime_error);

    Args bad_mode{"voxlasm", "check", "-n", "decimal"};
    EXPECT_THROW(cli::parse_common_args(bad_mode.argc(), bad_mode.argv(), 2), std::runtime_error);

    Args missing{"voxlasm", "check", "-c"};
    EXPECT_THROW(cli::parse_common_args(missing.argc(), missing.argv(), 2), std::runtime_error);
}

TEST(CliArgs, ResolveOutputPath) {
    EXPECT_EQ(cli::resolve_output_path("src/prog.vasm", ".tokens.json", ""), "src/prog.tokens.json");
    EXPECT_EQ(cli::resolve_output_path("dir.d/prog", ".tokens.json", ""), "dir.d/prog.tokens.json");
    EXPECT_EQ(cli::resolve_output_path("prog.vasm", ".tokens.json", "x.json"), "x.json");
}

TEST_F(CliTest, ConfigFileThenOverride) {
    std::string config = write("config.json", R"({"tokenizer": {"default_numeric": "signed"}})");

    cli::CommandContext ctx;
    ctx.config_path = config;
    EXPECT_EQ(cli::load_tokenizer_config(ctx).default_numeric, lexer::NumericMode::Signed);

    ctx.numeric_mode = lexer::NumericMode::Float;
    EXPECT_EQ(cli::load_tokenizer_config(ctx).default_numeric, lexer::NumericMode::Float);
}

TEST_F(CliTest, TokenizeWritesEnvelope) {
    std::string input = write("prog.vasm", "main:\n  ldi 52, $r0\n  call main\n");
    std::string output = (dir_ / "prog.tokens.json").string();

    Args args{"voxlasm", "tokenize", input};
    EXPECT_EQ(cli::command_tokenize(args.argc(), args.argv()), cli::EXIT_OK);

    ASSERT_TRUE(fs::exists(output));
    auto j = json::read_json_file(output);
    EXPECT_EQ(j["step"], "tokens");
    EXPECT_EQ(j["source_file"], input);
    EXPECT_EQ(j["config"]["tokenizer"]["default_numeric"], "unsigned");
    EXPECT_EQ(j["stats"]["token_count"], 8);
    EXPECT_EQ(j["stats"]["line_count"], 3);
    ASSERT_EQ(j["data"].size(), 8u);
    EXPECT_EQ(j["data"][3]["value"], 52);

    text::FileRegistry registry;
    auto doc = json::read_token_document(output, registry);
    EXPECT_EQ(doc.tokens.size(), 8u);
    EXPECT_EQ(doc.file->name, input);
}

TEST_F(CliTest, TokenizeReportsLexError) {
    std::string input = write("bad.vasm", "ldi 5, $rzz\n");
    std::string output = (dir_ / "bad.json").string();

    Args args{"voxlasm", "tokenize", input, "-o", output};
    EXPECT_EQ(cli::command_tokenize(args.argc(), args.argv()), cli::EXIT_SOURCE_ERROR);
    EXPECT_FALSE(fs::exists(output));
}

TEST_F(CliTest, TokenizeFloatIsInternalError) {
    std::string input = write("float.vasm", "ldi 1.5, $r0\n");

    Args args{"voxlasm", "tokenize", input, "-n", "float"};
    EXPECT_EQ(cli::command_tokenize(args.argc(), args.argv()), cli::EXIT_INTERNAL_ERROR);
}

TEST_F(CliTest, TokenizeMissingInput) {
    Args args{"voxlasm", "tokenize", (dir_ / "absent.vasm").string()};
    EXPECT_EQ(cli::command_tokenize(args.argc(), args.argv()), cli::EXIT_SOURCE_ERROR);
}

TEST_F(CliTest, CheckManyFiles) {
    std::vector<std::string> good;
    for (int i = 0; i < 4; ++i) {
        good.push_back(write("good" + std::to_string(i) + ".vasm",
                             "%repeat " + std::to_string(i) + "\npush $r" + std::to_string(i) +
                             "\n%end_repeat\n"));
    }

    Args all_good{"voxlasm", "check", good[0], good[1], good[2], good[3]};
    EXPECT_EQ(cli::command_check(all_good.argc(), all_good.argv()), cli::EXIT_OK);

    std::string bad = write("bad.vasm", "jmp %nope\n");
    Args mixed{"voxlasm", "check", good[0], bad, good[1]};
    EXPECT_EQ(cli::command_check(mixed.argc(), mixed.argv()), cli::EXIT_SOURCE_ERROR);

    std::string signed_source = write("signed.vasm", "ldi -4, $r1\n");
    Args signed_mode{"voxlasm", "check", "-n", "signed", signed_source};
    EXPECT_EQ(cli::command_check(signed_mode.argc(), signed_mode.argv()), cli::EXIT_OK);

    Args float_mode{"voxlasm", "check", "-n", "float", signed_source};
    EXPECT_EQ(cli::command_check(float_mode.argc(), float_mode.argv()), cli::EXIT_INTERNAL_ERROR);
}

TEST_F(CliTest, ShowListsTokensAgainstSource) {
    std::string input = write("show.vasm", "%repeat 0u2\n  push $rsp\n%end_repeat\n");
    std::string output = (dir_ / "show.tokens.json").string();

    Args tokenize{"voxlasm", "tokenize", input, "-o", output};
    ASSERT_EQ(cli::command_tokenize(tokenize.argc(), tokenize.argv()), cli::EXIT_OK);

    Args show{"voxlasm", "show", output};
    ::testing::internal::CaptureStdout();
    int rc = cli::command_show(show.argc(), show.argv());
    std::string listing = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, cli::EXIT_OK);
    EXPECT_EQ(listing,
              "1:1\tRepeat\t%repeat\tdirective repeat\n"
              "1:9\tUnsignedIntegerLiteral\t0u2\tvalue 2\n"
              "2:3\tOpcode\tpush\topcode 0x06 (push)\n"
              "2:8\tRegister\t$rsp\tregister 0\n"
              "3:1\tEndRepeat\t%end_repeat\tdirective end_repeat\n");
}

TEST_F(CliTest, ShowRejectsStaleSource) {
    std::string input = write("stale.vasm", "ldi 1, $r0\n");
    std::string output = (dir_ / "stale.tokens.json").string();

    Args tokenize{"voxlasm", "tokenize", input, "-o", output};
    ASSERT_EQ(cli::command_tokenize(tokenize.argc(), tokenize.argv()), cli::EXIT_OK);

    write("stale.vasm", "ldi 7, $r0\n");

    Args show{"voxlasm", "show", output};
    EXPECT_EQ(cli::command_show(show.argc(), show.argv()), cli::EXIT_SOURCE_ERROR);
}

TEST_F(CliTest, ShowRequiresTokenFile) {
    std::string input = write("plain.vasm", "ret\n");
    Args show{"voxlasm", "show", input};
    EXPECT_EQ(cli::command_show(show.argc(), show.argv()), cli::EXIT_SOURCE_ERROR);
}

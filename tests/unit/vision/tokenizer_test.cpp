#include <tessera/vision/tokenizer.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace tv = tessera::vision;
namespace fs = std::filesystem;

namespace {

const std::string kSp = "\xE2\x96\x81";

// ids:          0        1      2              3             4              5      6    7         8
std::vector<std::string> vocab() {
  return {"<unk>", "<s>", "<|im_end|>", kSp + "a", kSp + "cat", "cat", "a", "<0x41>", kSp};
}

}  // namespace

TEST(Tokenizer, GreedyLongestMatch) {
  tv::Tokenizer tok(vocab());
  EXPECT_EQ(tok.encode("a cat"), (std::vector<std::int64_t>{6, 4}));
  EXPECT_EQ(tok.encode(" a"), (std::vector<std::int64_t>{3}));
  EXPECT_EQ(tok.encode("cat"), (std::vector<std::int64_t>{5}));
}

TEST(Tokenizer, UnknownMapsToUnk) {
  tv::Tokenizer tok(vocab());
  EXPECT_EQ(tok.encode("z"), (std::vector<std::int64_t>{0}));
  // Multi-byte character consumes one <unk>.
  EXPECT_EQ(tok.encode("\xC3\xA9" "a"), (std::vector<std::int64_t>{0, 6}));
}

TEST(Tokenizer, UnknownDroppedWithoutUnkToken) {
  tv::Tokenizer tok({"a", "b"});
  EXPECT_EQ(tok.encode("axb"), (std::vector<std::int64_t>{0, 1}));
}

TEST(Tokenizer, DecodeRestoresSpaces) {
  tv::Tokenizer tok(vocab());
  const std::vector<std::int64_t> ids{6, 4};
  EXPECT_EQ(tok.decode(ids), "a cat");
}

TEST(Tokenizer, DecodeSkipsSpecialTokens) {
  tv::Tokenizer tok(vocab());
  const std::vector<std::int64_t> ids{1, 6, 4, 2};
  EXPECT_EQ(tok.decode(ids), "a cat");
  EXPECT_EQ(tok.decode(ids, /*skip_special=*/false), "<s>a cat<|im_end|>");
}

TEST(Tokenizer, ByteTokensDecodeToBytes) {
  tv::Tokenizer tok(vocab());
  const std::vector<std::int64_t> ids{7, 4};
  EXPECT_EQ(tok.decode(ids), "A cat");
  EXPECT_FALSE(tok.is_special(7));
  EXPECT_TRUE(tok.is_special(2));
  EXPECT_FALSE(tok.is_special(99));
}

TEST(Tokenizer, OutOfRangeIdsAreIgnored) {
  tv::Tokenizer tok(vocab());
  const std::vector<std::int64_t> ids{-1, 6, 1000};
  EXPECT_EQ(tok.decode(ids), "a");
}

TEST(Tokenizer, TokenLookup) {
  tv::Tokenizer tok(vocab());
  EXPECT_EQ(tok.token_id("<|im_end|>"), 2);
  EXPECT_FALSE(tok.token_id("dog").has_value());
  EXPECT_EQ(tok.vocab_size(), 9u);
}

TEST(Tokenizer, FromFile) {
  const auto path = fs::temp_directory_path() /
                    ("tessera_vocab_" + std::to_string(::getpid()) + ".txt");
  {
    std::ofstream f(path);
    f << "<unk>\r\n" << "a\n" << kSp << "b\n";
  }
  auto tok = tv::Tokenizer::from_file(path.string());
  EXPECT_EQ(tok.vocab_size(), 3u);
  EXPECT_EQ(tok.encode("a b"), (std::vector<std::int64_t>{1, 2}));
  fs::remove(path);
}

TEST(Tokenizer, FromFileMissingThrows) {
  EXPECT_THROW((void)tv::Tokenizer::from_file("/nonexistent/tessera/vocab.txt"),
               std::runtime_error);
}

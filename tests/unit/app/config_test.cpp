#include <invoscan/app/config.hpp>
#include <gtest/gtest.h>
#include "temp_dir.hpp"
#include <stdexcept>

namespace na = invoscan::app;

TEST(ConfigTest, MissingFileYieldsDefaults) {
  const auto c = na::load_config("/nonexistent/invoscan.conf");
  EXPECT_EQ(c.ocr_dir, "output/ocr");
  EXPECT_EQ(c.output_dir, "output");
  EXPECT_EQ(c.tagger_backend, na::TaggerBackendType::Mock);
  EXPECT_EQ(c.tagger_max_sequence_length, 512u);
  EXPECT_EQ(c.line_items.window_size, 8u);
  EXPECT_EQ(c.line_items.min_numeric_tokens, 3u);
  EXPECT_DOUBLE_EQ(c.line_items.row_tolerance, 2.0);
  EXPECT_DOUBLE_EQ(c.verification.margin_tolerance, 1.0);
  EXPECT_DOUBLE_EQ(c.verification.epsilon, 1e-5);
  EXPECT_EQ(c.num_workers, 0u);
  EXPECT_EQ(c.log_level, "info");
}

TEST(ConfigTest, LoadsKeyValueFile) {
  invoscan::test::TempDir dir;
  const auto path = dir.path() / "invoscan.conf";
  invoscan::test::write_text(path,
                             "# batch settings\n"
                             "ocr_dir = /data/ocr\n"
                             "output_dir=/data/out\n"
                             "\n"
                             "tagger_backend = onnx\n"
                             "tagger_model_path = ner.onnx\n"
                             "tagger_vocab_path = vocab.txt\n"
                             "tagger_labels_path = labels.txt\n"
                             "tagger_max_sequence_length = 256\n"
                             "margin_tolerance = 5\n"
                             "confidence_epsilon = 0.001\n"
                             "row_tolerance = 0.5\n"
                             "window_size = 10\n"
                             "min_numeric_tokens = 4\n"
                             "num_workers = 3\n"
                             "log_level = debug\n"
                             "unknown_key = ignored\n"
                             "no separator line\n");
  const auto c = na::load_config(path.string());
  EXPECT_EQ(c.ocr_dir, "/data/ocr");
  EXPECT_EQ(c.output_dir, "/data/out");
  EXPECT_EQ(c.tagger_backend, na::TaggerBackendType::Onnx);
  EXPECT_EQ(c.tagger_model_path, "ner.onnx");
  EXPECT_EQ(c.tagger_vocab_path, "vocab.txt");
  EXPECT_EQ(c.tagger_labels_path, "labels.txt");
  EXPECT_EQ(c.tagger_max_sequence_length, 256u);
  EXPECT_DOUBLE_EQ(c.verification.margin_tolerance, 5.0);
  EXPECT_DOUBLE_EQ(c.verification.epsilon, 0.001);
  EXPECT_DOUBLE_EQ(c.line_items.row_tolerance, 0.5);
  EXPECT_EQ(c.line_items.window_size, 10u);
  EXPECT_EQ(c.line_items.min_numeric_tokens, 4u);
  EXPECT_EQ(c.num_workers, 3u);
  EXPECT_EQ(c.log_level, "debug");
}

TEST(ConfigTest, UnknownBackendKeepsDefault) {
  invoscan::test::TempDir dir;
  const auto path = dir.path() / "invoscan.conf";
  invoscan::test::write_text(path, "tagger_backend = spacy\n");
  EXPECT_EQ(na::load_config(path.string()).tagger_backend, na::TaggerBackendType::Mock);
}

TEST(ConfigTest, BadNumberThrows) {
  invoscan::test::TempDir dir;
  const auto path = dir.path() / "invoscan.conf";
  invoscan::test::write_text(path, "margin_tolerance = lots\n");
  EXPECT_THROW(na::load_config(path.string()), std::invalid_argument);
}

TEST(ConfigTest, ParseTaggerBackend) {
  na::TaggerBackendType t = na::TaggerBackendType::Mock;
  EXPECT_TRUE(na::parse_tagger_backend("onnx", t));
  EXPECT_EQ(t, na::TaggerBackendType::Onnx);
  EXPECT_TRUE(na::parse_tagger_backend("mock", t));
  EXPECT_EQ(t, na::TaggerBackendType::Mock);
  EXPECT_FALSE(na::parse_tagger_backend("ONNX", t));
  EXPECT_EQ(t, na::TaggerBackendType::Mock);
}

#include <neurolens/core/frame.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace nc = neurolens::core;

TEST(Frame, DefaultEmpty) {
  nc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_EQ(f.size_bytes(), 0u);
  EXPECT_FALSE(f.is_consistent());
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 100 * 3);
  nc::Frame f(100, 100, nc::PixelFormat::BGR8, std::move(buf));
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 100u);
  EXPECT_EQ(f.format(), nc::PixelFormat::BGR8);
  EXPECT_EQ(f.channels(), 3u);
  EXPECT_FALSE(f.empty());
  EXPECT_TRUE(f.is_consistent());
  EXPECT_EQ(f.pixels().size(), 100u * 100 * 3);
  EXPECT_EQ(f.row_stride(), 300u);
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(nc::Frame::min_bytes(10, 10, nc::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(nc::Frame::min_bytes(10, 10, nc::PixelFormat::RGB8), 300u);
  EXPECT_EQ(nc::Frame::min_bytes(10, 10, nc::PixelFormat::Float32RGB), 10u * 10 * 3 * 4);
  EXPECT_EQ(nc::Frame::min_bytes(10, 10, nc::PixelFormat::Unknown), 0u);
}

TEST(Frame, FloatRowStride) {
  std::vector<std::byte> buf(4 * 2 * 3 * sizeof(float));
  nc::Frame f(4, 2, nc::PixelFormat::Float32RGB, std::move(buf));
  EXPECT_EQ(f.row_stride(), 4u * 3 * sizeof(float));
  EXPECT_TRUE(f.is_consistent());
}

TEST(Frame, ShortBufferIsInconsistent) {
  std::vector<std::byte> buf(10);
  nc::Frame f(4, 4, nc::PixelFormat::RGB8, std::move(buf));
  EXPECT_FALSE(f.is_consistent());
}

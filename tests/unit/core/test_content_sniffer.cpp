/**
 * @file test_content_sniffer.cpp
 * @brief Unit tests for content type detection
 */

#include <gtest/gtest.h>

#include "pipedream/core/content_sniffer.h"

#include <cstring>
#include <string>
#include <vector>

namespace pipedream::test {

namespace {

auto sniff(const std::string& text) -> std::string {
    std::vector<std::byte> data(text.size());
    std::memcpy(data.data(), text.data(), text.size());
    return detect_content_type(data);
}

auto sniff(std::initializer_list<unsigned char> bytes) -> std::string {
    std::vector<std::byte> data;
    for (auto b : bytes) {
        data.push_back(static_cast<std::byte>(b));
    }
    return detect_content_type(data);
}

}  // namespace

TEST(ContentSnifferTest, EmptyIsPlainText) {
    EXPECT_EQ(sniff(std::string{}), "text/plain; charset=utf-8");
}

TEST(ContentSnifferTest, PlainText) {
    EXPECT_EQ(sniff("just some words\n"), "text/plain; charset=utf-8");
}

TEST(ContentSnifferTest, HtmlWithLeadingWhitespace) {
    EXPECT_EQ(sniff("  \n<HTML><body></body></HTML>"), "text/html; charset=utf-8");
    EXPECT_EQ(sniff("<!DOCTYPE html>"), "text/html; charset=utf-8");
}

TEST(ContentSnifferTest, Xml) {
    EXPECT_EQ(sniff("<?xml version=\"1.0\"?><a/>"), "text/xml; charset=utf-8");
}

TEST(ContentSnifferTest, Pdf) {
    EXPECT_EQ(sniff("%PDF-1.7\n"), "application/pdf");
}

TEST(ContentSnifferTest, Png) {
    EXPECT_EQ(sniff({0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0x00}), "image/png");
}

TEST(ContentSnifferTest, Jpeg) {
    EXPECT_EQ(sniff({0xFF, 0xD8, 0xFF, 0xE0}), "image/jpeg");
}

TEST(ContentSnifferTest, Gzip) {
    EXPECT_EQ(sniff({0x1F, 0x8B, 0x08, 0x00}), "application/x-gzip");
}

TEST(ContentSnifferTest, Zip) {
    EXPECT_EQ(sniff({'P', 'K', 0x03, 0x04, 0x00}), "application/zip");
}

TEST(ContentSnifferTest, BinaryFallsBackToOctetStream) {
    EXPECT_EQ(sniff({'R', 'E', 'D', 'I', 'S', 0x00, 0x01, 0x02}), "application/octet-stream");
}

TEST(ContentSnifferTest, Utf8BomIsText) {
    EXPECT_EQ(sniff({0xEF, 0xBB, 0xBF, 'h', 'i'}), "text/plain; charset=utf-8");
}

TEST(ContentSnifferTest, OnlyFirstBlockIsConsidered) {
    std::string text(sniff_length, 'a');
    text += std::string(16, '\0');
    EXPECT_EQ(sniff(text), "text/plain; charset=utf-8");
}

}  // namespace pipedream::test

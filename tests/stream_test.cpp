/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/stream.hpp"
#include "memory_stream.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using gw::internal::IoStatus;
using gw::test::MemoryStream;

TEST(StreamTest, ReadExactAcrossChunks) {
    MemoryStream s("abcdefgh", 3);
    std::string out;
    ASSERT_EQ(s.read_exact(5, out), IoStatus::Ok);
    EXPECT_EQ(out, "abcde");
    ASSERT_EQ(s.read_exact(3, out), IoStatus::Ok);
    EXPECT_EQ(out, "fgh");
    EXPECT_EQ(s.read_exact(1, out), IoStatus::Eof);
}

TEST(StreamTest, ReadLineStripsCarriageReturn) {
    MemoryStream s("one\r\ntwo\nthree");
    std::string line;
    ASSERT_EQ(s.read_line(line, 100), IoStatus::Ok);
    EXPECT_EQ(line, "one");
    ASSERT_EQ(s.read_line(line, 100), IoStatus::Ok);
    EXPECT_EQ(line, "two");
    EXPECT_EQ(s.read_line(line, 100), IoStatus::Eof);
}

TEST(StreamTest, ReadLineKeepsInnerCarriageReturn) {
    MemoryStream s("a\rb\r\n");
    std::string line;
    ASSERT_EQ(s.read_line(line, 100), IoStatus::Ok);
    EXPECT_EQ(line, "a\rb");
}

TEST(StreamTest, ReadLineLimit) {
    MemoryStream s("12345\r\n");
    std::string line;
    EXPECT_EQ(s.read_line(line, 4), IoStatus::TooLong);

    MemoryStream t("12345\r\n");
    ASSERT_EQ(t.read_line(line, 5), IoStatus::Ok);
    EXPECT_EQ(line, "12345");
}

TEST(StreamTest, ReadLineWithoutPracticalLimit) {
    MemoryStream s("partial", 3);
    std::string line;
    EXPECT_EQ(s.read_line(line, SIZE_MAX), IoStatus::Eof);

    MemoryStream t("no limit\r\nrest", 3);
    ASSERT_EQ(t.read_line(line, SIZE_MAX), IoStatus::Ok);
    EXPECT_EQ(line, "no limit");
}

TEST(StreamTest, ReadToEndReturnsBufferedBytesFirst) {
    MemoryStream s("head\nbody bytes", 1024);
    std::string line, rest;
    ASSERT_EQ(s.read_line(line, 100), IoStatus::Ok);
    EXPECT_GT(s.buffered(), 0u);
    ASSERT_EQ(s.read_to_end(rest), IoStatus::Ok);
    EXPECT_EQ(rest, "body bytes");
    EXPECT_EQ(s.buffered(), 0u);
}

TEST(StreamTest, WriteAll) {
    MemoryStream s("");
    ASSERT_EQ(s.write_all("gemini://x/\r\n"), IoStatus::Ok);
    EXPECT_EQ(s.written(), "gemini://x/\r\n");
}

TEST(StreamTest, ErrorCauseIsExposed) {
    MemoryStream s("abc");
    s.fail_reads_at(0, IoStatus::Error);
    std::string out;
    EXPECT_EQ(s.read_exact(1, out), IoStatus::Error);
    EXPECT_EQ(s.io_error(), "injected read failure");
}

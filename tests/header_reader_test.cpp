/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/header_reader.hpp"
#include "memory_stream.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace gw;
using gw::internal::IoStatus;
using gw::internal::read_response_header;
using gw::test::MemoryStream;

namespace {
constexpr std::size_t kMeta = 1024;
}

TEST(HeaderReaderTest, DecodesStatusAndMeta) {
    MemoryStream s("20 text/gemini; charset=utf-8\r\n");
    ResponseHeader h;
    Error err;
    ASSERT_TRUE(read_response_header(s, kMeta, h, err)) << err.message;
    EXPECT_EQ(h.status, StatusCode::Success);
    EXPECT_EQ(h.meta, "text/gemini; charset=utf-8");
}

TEST(HeaderReaderTest, AcceptsBareNewline) {
    MemoryStream s("51 not found\n");
    ResponseHeader h;
    Error err;
    ASSERT_TRUE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(h.status, StatusCode::NotFound);
    EXPECT_EQ(h.meta, "not found");
}

TEST(HeaderReaderTest, EmptyMeta) {
    MemoryStream s("20 \r\n");
    ResponseHeader h;
    Error err;
    ASSERT_TRUE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(h.meta, "");
}

TEST(HeaderReaderTest, LeavesCursorAtBody) {
    // header and body arrive in the same chunk
    MemoryStream s("20 text/plain\r\nhello\r\nworld", 4096);
    ResponseHeader h;
    Error err;
    ASSERT_TRUE(read_response_header(s, kMeta, h, err));

    std::string rest;
    ASSERT_EQ(s.read_to_end(rest), IoStatus::Ok);
    EXPECT_EQ(rest, "hello\r\nworld");
}

TEST(HeaderReaderTest, ByteByByteDelivery) {
    MemoryStream s("31 gemini://example.org/new\r\nX", 1);
    ResponseHeader h;
    Error err;
    ASSERT_TRUE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(h.status, StatusCode::RedirectPermanent);
    EXPECT_EQ(h.meta, "gemini://example.org/new");
    EXPECT_EQ(s.buffered() + s.source_remaining(), 1u);
}

TEST(HeaderReaderTest, OneByteThenCloseIsTruncated) {
    MemoryStream s("2");
    ResponseHeader h;
    h.meta = "untouched";
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::TruncatedHeader);
    EXPECT_EQ(h.meta, "untouched");
}

TEST(HeaderReaderTest, EmptyStreamIsTruncated) {
    MemoryStream s("");
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::TruncatedHeader);
}

TEST(HeaderReaderTest, MissingNewlineIsTruncated) {
    MemoryStream s("20 text/gemini");
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::TruncatedHeader);
}

TEST(HeaderReaderTest, CloseBeforeSeparatorIsTruncated) {
    MemoryStream s("20");
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::TruncatedHeader);
}

TEST(HeaderReaderTest, NonDigitStatusIsMalformed) {
    MemoryStream s("ab text/gemini\r\n");
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::MalformedStatus);
}

TEST(HeaderReaderTest, SignIsNotADigit) {
    MemoryStream s("+2 text/gemini\r\n");
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::MalformedStatus);
}

TEST(HeaderReaderTest, UndefinedStatusIsUnknown) {
    MemoryStream s("25 text/gemini\r\n");
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::UnknownStatus);
}

TEST(HeaderReaderTest, MissingSpaceIsMalformedHeader) {
    MemoryStream s("20\ttext/gemini\r\n");
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::MalformedHeader);
}

TEST(HeaderReaderTest, ThreeDigitStatusIsMalformedHeader) {
    MemoryStream s("200 text/gemini\r\n");
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::MalformedHeader);
}

TEST(HeaderReaderTest, MetaAtLimitIsAccepted) {
    const std::string meta(kMeta, 'x');
    MemoryStream s("42 " + meta + "\r\n", 100);
    ResponseHeader h;
    Error err;
    ASSERT_TRUE(read_response_header(s, kMeta, h, err)) << err.message;
    EXPECT_EQ(h.meta.size(), kMeta);
}

TEST(HeaderReaderTest, MaximalCapStillDecodes) {
    MemoryStream s("20 text/gemini\r\nbody", 4);
    ResponseHeader h;
    Error err;
    ASSERT_TRUE(read_response_header(s, SIZE_MAX, h, err)) << err.message;
    EXPECT_EQ(h.meta, "text/gemini");
}

TEST(HeaderReaderTest, MetaOverLimitIsTooLong) {
    const std::string meta(kMeta + 1, 'x');
    MemoryStream s("42 " + meta + "\r\n", 100);
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::HeaderTooLong);
}

TEST(HeaderReaderTest, EndlessMetaStopsAtLimit) {
    // no newline ever; the reader must give up without draining the stream
    MemoryStream s("40 " + std::string(1u << 20, 'x'), 512);
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, 64, h, err));
    EXPECT_EQ(err.code, ErrorCode::HeaderTooLong);
    EXPECT_GT(s.source_remaining(), (1u << 20) - 4096);
}

TEST(HeaderReaderTest, TimeoutIsNotTruncation) {
    MemoryStream s("20 text/gem");
    s.fail_reads_at(5, IoStatus::Timeout);
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::Timeout);
}

TEST(HeaderReaderTest, TransportErrorIsIoError) {
    MemoryStream s("20 text/gemini\r\n");
    s.fail_reads_at(1, IoStatus::Error);
    ResponseHeader h;
    Error err;
    EXPECT_FALSE(read_response_header(s, kMeta, h, err));
    EXPECT_EQ(err.code, ErrorCode::IoError);
    EXPECT_NE(err.message.find("injected"), std::string::npos);
}

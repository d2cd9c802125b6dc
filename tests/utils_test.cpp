/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/utils.hpp"
#include "gw/error.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace gw::internal;

TEST(MediaTypeTest, TypeAndCharset) {
    std::string type, charset;
    split_media_type("text/gemini; charset=UTF-8; lang=en", type, charset);
    EXPECT_EQ(type, "text/gemini");
    EXPECT_EQ(charset, "utf-8");

    split_media_type(" Text/Plain ", type, charset);
    EXPECT_EQ(type, "text/plain");
    EXPECT_EQ(charset, "");

    split_media_type("text/plain;charset=\"us-ascii\"", type, charset);
    EXPECT_EQ(charset, "us-ascii");
}

TEST(Utf8Test, Valid) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x9A\x80"));
}

TEST(Utf8Test, Invalid) {
    EXPECT_FALSE(is_valid_utf8("\xC3"));              // truncated
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));          // overlong
    EXPECT_FALSE(is_valid_utf8("\xE0\x80\xAF"));      // overlong
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));  // > U+10FFFF
    EXPECT_FALSE(is_valid_utf8("\xFF"));
}

TEST(EscapeBytesTest, ShowsControlBytes) {
    EXPECT_EQ(escape_bytes("a\r\n\x01"), "a\\r\\n\\x01");
}

TEST(ErrorTest, FailFillsError) {
    gw::Error err;
    EXPECT_FALSE(gw::fail(err, gw::ErrorCode::HeaderTooLong, "too long"));
    EXPECT_EQ(err.code, gw::ErrorCode::HeaderTooLong);
    EXPECT_EQ(err.message, "too long");
    EXPECT_STREQ(gw::error_code_name(err.code), "HeaderTooLong");
}

/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/exchange.hpp"
#include "gw/internal/request.hpp"
#include "memory_stream.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace gw;
using gw::internal::IoStatus;
using gw::internal::build_request;
using gw::internal::run_exchange;
using gw::test::MemoryStream;

TEST(ExchangeTest, WritesRequestThenRendersBody) {
    std::string line;
    Error err;
    ASSERT_TRUE(build_request("example.org", "/index.gmi", line, err));

    MemoryStream s("20 text/gemini\r\n# Welcome\n");
    DispatchOutcome out;
    ASSERT_TRUE(run_exchange(s, line, 1024, out, err)) << err.message;
    EXPECT_EQ(s.written(), "gemini://example.org/index.gmi\r\n");
    EXPECT_EQ(out.kind, OutcomeKind::Body);
    EXPECT_EQ(out.body, "# Welcome\n");
}

TEST(ExchangeTest, WriteTimeout) {
    MemoryStream s("20 text/gemini\r\n");
    s.fail_writes(IoStatus::Timeout);
    DispatchOutcome out;
    Error err;
    EXPECT_FALSE(run_exchange(s, "gemini://example.org/\r\n", 1024, out, err));
    EXPECT_EQ(err.code, ErrorCode::Timeout);
    EXPECT_EQ(s.recv_calls(), 0u);
}

TEST(ExchangeTest, WriteErrorIsIoError) {
    MemoryStream s("20 text/gemini\r\n");
    s.fail_writes(IoStatus::Error);
    DispatchOutcome out;
    Error err;
    EXPECT_FALSE(run_exchange(s, "gemini://example.org/\r\n", 1024, out, err));
    EXPECT_EQ(err.code, ErrorCode::IoError);
}

TEST(ExchangeTest, HeaderErrorPropagates) {
    MemoryStream s("99 what\r\n");
    DispatchOutcome out;
    out.meta = "untouched";
    Error err;
    EXPECT_FALSE(run_exchange(s, "gemini://example.org/\r\n", 1024, out, err));
    EXPECT_EQ(err.code, ErrorCode::UnknownStatus);
    EXPECT_EQ(out.meta, "untouched");
}

TEST(ExchangeTest, HeaderCapComesFromCaller) {
    MemoryStream s("20 text/gemini; charset=utf-8\r\n");
    DispatchOutcome out;
    Error err;
    EXPECT_FALSE(run_exchange(s, "gemini://example.org/\r\n", 10, out, err));
    EXPECT_EQ(err.code, ErrorCode::HeaderTooLong);
}

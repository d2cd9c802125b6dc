/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/client.hpp"
#include "loopback_server.hpp"

#include <gtest/gtest.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <string>

using namespace gw;
using gw::test::LoopbackTlsServer;

namespace {

std::string request_for(std::uint16_t port, const std::string& resource) {
    return "gemini://127.0.0.1:" + std::to_string(port) + resource + "\r\n";
}

} // namespace

TEST(TransportTest, RefusedPortIsConnectionFailed) {
    // A bound but non-listening socket keeps the port ours and refuses connects.
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(fd, (sockaddr*)&addr, sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(fd, (sockaddr*)&addr, &len), 0);

    DispatchOutcome out;
    Error err;
    EXPECT_FALSE(perform_request("127.0.0.1", ntohs(addr.sin_port), "/", out, err));
    EXPECT_EQ(err.code, ErrorCode::ConnectionFailed);
    EXPECT_FALSE(err.message.empty());
    ::close(fd);
}

TEST(TransportTest, BodyEndsWithoutCloseNotify) {
    LoopbackTlsServer srv("20 text/gemini\r\nhi");
    ASSERT_TRUE(srv.ready());

    DispatchOutcome out;
    Error err;
    ASSERT_TRUE(perform_request("127.0.0.1", srv.port(), "/", out, err))
        << error_code_name(err.code) << ": " << err.message;
    EXPECT_EQ(out.kind, OutcomeKind::Body);
    EXPECT_EQ(out.status, StatusCode::Success);
    EXPECT_EQ(out.meta, "text/gemini");
    EXPECT_EQ(out.body, "hi");
    EXPECT_EQ(srv.request(), request_for(srv.port(), "/"));
}

TEST(TransportTest, FailureStatusOverTls) {
    LoopbackTlsServer srv("51 not found\r\nignored trailer");
    ASSERT_TRUE(srv.ready());

    DispatchOutcome out;
    Error err;
    ASSERT_TRUE(perform_request("127.0.0.1", srv.port(), "/missing", out, err)) << err.message;
    EXPECT_EQ(out.kind, OutcomeKind::Failure);
    EXPECT_EQ(out.status, StatusCode::NotFound);
    EXPECT_EQ(out.meta, "not found");
    EXPECT_TRUE(out.body.empty());
}

TEST(TransportTest, UppercaseSchemeInHostIsNormalized) {
    LoopbackTlsServer srv("20 text/plain\r\nok");
    ASSERT_TRUE(srv.ready());

    ClientConfig cfg;
    cfg.host = "GEMINI://127.0.0.1";
    cfg.port = srv.port();
    Client cli(cfg);
    DispatchOutcome out;
    Error err;
    ASSERT_TRUE(cli.perform_request("/x", out, err))
        << error_code_name(err.code) << ": " << err.message;
    EXPECT_EQ(out.body, "ok");
    EXPECT_EQ(srv.request(), request_for(srv.port(), "/x"));
}

TEST(TransportTest, VerifiedPeerRejectsSelfSignedCertificate) {
    LoopbackTlsServer srv("20 text/gemini\r\nhi");
    ASSERT_TRUE(srv.ready());

    ClientConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = srv.port();
    cfg.tls_verify_peer = true;
    Client cli(cfg);
    DispatchOutcome out;
    Error err;
    EXPECT_FALSE(cli.perform_request("/", out, err));
    EXPECT_EQ(err.code, ErrorCode::ConnectionFailed);
    EXPECT_TRUE(srv.request().empty());
}

// SPDX-License-Identifier: Apache-2.0
// Part of Gemwire (GW) project.
// apps/gw_client_cli.cpp

#include "gw/client.hpp"
#include "gw/response.hpp"
#include "gw/url.hpp"

#include <iostream>
#include <string>
#include <algorithm>
#include <cstdint>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " [host] [port] [--resource /path] [--max-redirects N]\n"
      "      [--verify 0|1] [--ca ca.pem] [--cert client.crt --key client.key]\n"
      "      [--connect_timeout <sec>] [--io_timeout <sec>] [--log FILE]\n"
      "\n"
      "  host             server to connect to (default gemini.circumlunar.space)\n"
      "  port             server port (default: from host, else 1965)\n"
      "  --resource       path-and-query to fetch; prompted for when omitted\n"
      "  --max-redirects  redirect hops to follow (default 5, 0 = report only)\n"
      "  --verify         verify the server certificate (default 0)\n";
}

static bool parse_port(const std::string& s, std::uint16_t& out){
    if (s.empty() || s.size() > 5) return false;
    if (!std::all_of(s.begin(), s.end(), [](char c){ return c >= '0' && c <= '9'; })) return false;
    const int v = std::stoi(s);
    if (v < 1 || v > 65535) return false;
    out = (std::uint16_t)v;
    return true;
}

static bool parse_int(const std::string& s, int& out){
    if (s.empty() || s.size() > 9) return false;
    if (!std::all_of(s.begin(), s.end(), [](char c){ return c >= '0' && c <= '9'; })) return false;
    out = std::stoi(s);
    return true;
}

int main(int argc, char** argv){
    gw::ClientConfig cfg;
    std::string resource;
    bool have_resource = false;
    int max_redirects = 5;

    int positional = 0;
    for(int i=1;i<argc;++i){
        std::string a=argv[i];
        int n = 0;
        if(a=="--resource" && i+1<argc) { resource = argv[++i]; have_resource = true; }
        else if(a=="--max-redirects" && i+1<argc) {
            if(!parse_int(argv[++i], max_redirects)) { usage(argv[0]); return 2; }
        }
        else if(a=="--verify" && i+1<argc) {
            if(!parse_int(argv[++i], n)) { usage(argv[0]); return 2; }
            cfg.tls_verify_peer = (n != 0);
        }
        else if(a=="--ca" && i+1<argc) cfg.tls_ca_file = argv[++i];
        else if(a=="--cert" && i+1<argc) cfg.tls_client_cert_file = argv[++i];
        else if(a=="--key" && i+1<argc) cfg.tls_client_key_file = argv[++i];
        else if(a=="--connect_timeout" && i+1<argc) {
            if(!parse_int(argv[++i], n)) { usage(argv[0]); return 2; }
            cfg.connect_timeout_sec = std::max(1, n);
        }
        else if(a=="--io_timeout" && i+1<argc) {
            if(!parse_int(argv[++i], n)) { usage(argv[0]); return 2; }
            cfg.io_timeout_sec = std::max(1, n);
        }
        else if(a=="--log" && i+1<argc) cfg.log_file = argv[++i];
        else if(!a.empty() && a[0] != '-' && positional == 0) { cfg.host = a; ++positional; }
        else if(!a.empty() && a[0] != '-' && positional == 1) {
            if(!parse_port(a, cfg.port)) { usage(argv[0]); return 2; }
            ++positional;
        }
        else { usage(argv[0]); return 2; }
    }

    // Where we are, for resolving relative redirect targets. A port inside
    // the host argument counts unless a port argument overrides it.
    gw::GeminiUrl current;
    if (!gw::parse_host_arg(cfg.host, current)) {
        std::cerr << "Bad host: " << cfg.host << "\n";
        usage(argv[0]);
        return 2;
    }
    cfg.host = current.host;
    if (positional >= 2) current.port = cfg.port;
    else cfg.port = current.port;

    if (!have_resource) {
        std::cout << "What resource do you want to access on " << cfg.host << "?: " << std::endl;
        if (!std::getline(std::cin, resource) || resource.empty()) resource = "/";
    }
    if (resource.empty() || resource[0] != '/') resource.insert(resource.begin(), '/');
    current.resource = resource;

    int hops = 0;
    for (;;) {
        gw::Client cli(cfg);
        gw::DispatchOutcome outcome;
        gw::Error err;
        if (!cli.perform_request(current.resource, outcome, err)) {
            std::cerr << "Request failed (" << gw::error_code_name(err.code) << "): "
                      << err.message << "\n";
            return 1;
        }

        const int code = gw::status_value(outcome.status);
        switch (outcome.kind) {
        case gw::OutcomeKind::Body:
            std::cout << "Server returned:\n" << outcome.body << std::endl;
            return 0;

        case gw::OutcomeKind::UnsupportedMediaType:
            std::cerr << "I only know how to handle text MIME types, got: " << outcome.meta << "\n";
            return 1;

        case gw::OutcomeKind::Redirect: {
            gw::GeminiUrl next;
            if (hops >= max_redirects) {
                std::cerr << "Got a redirect (" << code << ") to " << outcome.meta << "\n";
                return 1;
            }
            if (!gw::resolve_redirect(current, outcome.meta, next)) {
                std::cerr << "Cannot follow redirect to " << outcome.meta << "\n";
                return 1;
            }
            ++hops;
            std::cerr << "Following redirect " << hops << "/" << max_redirects
                      << " to " << outcome.meta << "\n";
            current = next;
            cfg.host = current.host;
            cfg.port = current.port;
            continue;
        }

        case gw::OutcomeKind::InputRequested: {
            std::cout << outcome.meta << (outcome.status == gw::StatusCode::SensitiveInput ? " (sensitive)" : "")
                      << ": " << std::endl;
            std::string answer;
            if (!std::getline(std::cin, answer)) {
                std::cerr << "No input given\n";
                return 1;
            }
            current.resource = current.resource.substr(0, current.resource.find('?')) +
                               "?" + gw::percent_encode(answer);
            continue;
        }

        case gw::OutcomeKind::Failure:
            if (outcome.status == gw::StatusCode::NotFound) {
                std::cerr << "Page not found!\n";
            } else if (outcome.status == gw::StatusCode::BadRequest) {
                std::cerr << "Oops! Looks like we made a bad request :( please try again.\n";
            } else if (gw::is_temporary_failure(outcome.status)) {
                std::cerr << "We failed - but only for now. This is what the server returned: "
                          << code << " " << gw::status_name(outcome.status) << ": " << outcome.meta << "\n";
            } else if (gw::is_cert_error(outcome.status)) {
                std::cerr << "Client certificate problem (" << gw::status_name(outcome.status)
                          << "): " << outcome.meta << "\n";
            } else {
                std::cerr << "We failed - big time. This is what the server returned: "
                          << code << " " << gw::status_name(outcome.status) << ": " << outcome.meta << "\n";
            }
            return 1;

        case gw::OutcomeKind::UnhandledStatus:
            std::cerr << "I don't know how to handle " << gw::status_name(outcome.status) << "\n";
            return 1;
        }
        return 1;
    }
}

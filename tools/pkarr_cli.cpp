// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// pkarr-cli -- offline key and signed packet utility
//
// Usage:
//   pkarr-cli [options] <command>
//
// Commands:
//   -keygen                       Generate a keypair
//   -sign -secret=<hex> -name=<n> -txt=<t> [-ttl=<s>] [-seq=<n>]
//                                 Sign a TXT record, print the relay body
//   -verify -pubkey=<z32> -body=<hex>
//                                 Verify a relay body and print its records
//
// Only the logging keys of the configuration apply here.
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "core/hex.h"
#include "core/logging.h"
#include "crypto/ed25519.h"
#include "dns/packet.h"
#include "pkarr/signed_packet.h"
#include "server/context.h"
#include "server/logging_init.h"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <span>
#include <string>

namespace {

void print_usage() {
    std::cout
        << server::get_client_name() << "\n"
        << "\n"
        << "Usage:\n"
        << "  pkarr-cli [options] <command>\n"
        << "\n"
        << "Commands:\n"
        << "  -keygen                   Generate a keypair\n"
        << "  -sign                     Sign a TXT record: -secret=<hex> "
           "-name=<n> -txt=<t>\n"
        << "                            [-ttl=<s>] [-seq=<n>]\n"
        << "  -verify                   Verify a relay body: -pubkey=<z32> "
           "-body=<hex>\n"
        << "\n"
        << "Options:\n"
        << "  -h, -help, -?             Show this help message and exit\n"
        << "  -version                  Show version information and exit\n"
        << "  -conf=<file>              Read options from <file>\n"
        << "  -loglevel=<level>         trace, debug, info, warn, error "
           "(default: warn)\n"
        << "  -debug=<cats>             Comma-separated categories: dht, "
           "cache, resolver,\n"
        << "                            ratelimit, crypto, dns, client, "
           "config, all\n"
        << "  -logfile=<file>           Also write the log to <file>\n"
        << "  -printtoconsole=<0|1>     Log to stderr (default: 1)\n";
}

int fail(const std::string& what) {
    std::cerr << "error: " << what << std::endl;
    return EXIT_FAILURE;
}

int fail(const core::Error& err) {
    return fail(err.format());
}

int cmd_keygen() {
    crypto::Keypair keypair = crypto::Keypair::generate();
    std::cout << "secret:     " << core::to_hex(keypair.secret()) << "\n"
              << "public key: " << keypair.public_key().to_zbase32()
              << std::endl;
    return EXIT_SUCCESS;
}

int cmd_sign(const core::Config& args) {
    auto secret = core::from_hex(args.get_or("secret", ""));
    if (!secret || secret->size() != crypto::ED25519_SECRET_KEY_SIZE) {
        return fail("-secret must be " +
                    std::to_string(crypto::ED25519_SECRET_KEY_SIZE * 2) +
                    " hex characters");
    }
    auto keypair = crypto::Keypair::from_secret(
        std::span<const uint8_t, crypto::ED25519_SECRET_KEY_SIZE>(
            secret->data(), crypto::ED25519_SECRET_KEY_SIZE));
    if (!keypair.ok()) return fail(keypair.error());

    auto name = args.get("name");
    auto text = args.get("txt");
    if (!name || !text) {
        return fail("-sign needs -name=<name> and -txt=<text>");
    }
    int64_t ttl = args.get_int("ttl", pkarr::DEFAULT_MINIMUM_TTL);
    if (ttl < 0 || ttl > static_cast<int64_t>(UINT32_MAX)) {
        return fail("-ttl out of range");
    }

    dns::Packet packet = dns::Packet::new_reply(0);
    try {
        packet.answers.push_back(
            dns::ResourceRecord::txt(*name, *text, static_cast<uint32_t>(ttl)));
    } catch (const std::exception& e) {
        return fail(e.what());
    }

    auto signed_packet =
        args.has("seq")
            ? pkarr::SignedPacket::from_packet(
                  keypair.value(), packet,
                  static_cast<uint64_t>(args.get_int("seq", 0)))
            : pkarr::SignedPacket::from_packet(keypair.value(), packet);
    if (!signed_packet.ok()) return fail(signed_packet.error());

    std::cout << "public key: "
              << signed_packet.value().public_key().to_zbase32() << "\n"
              << "sequence:   " << signed_packet.value().sequence() << "\n"
              << "body:       "
              << core::to_hex(signed_packet.value().to_relay_payload())
              << std::endl;
    return EXIT_SUCCESS;
}

int cmd_verify(const core::Config& args) {
    auto public_key =
        crypto::PublicKey::from_zbase32(args.get_or("pubkey", ""));
    if (!public_key.ok()) return fail(public_key.error());

    auto body = core::from_hex(args.get_or("body", ""));
    if (!body) return fail("-body is not valid hex");

    auto signed_packet =
        pkarr::SignedPacket::from_relay_payload(public_key.value(), *body);
    if (!signed_packet.ok()) return fail(signed_packet.error());

    std::cout << signed_packet.value().to_string() << std::endl;
    return EXIT_SUCCESS;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::Config args;
    args.parse_args(argc, argv);

    if (args.has("h") || args.has("help") || args.has("?")) {
        print_usage();
        return EXIT_SUCCESS;
    }
    if (args.has("version")) {
        server::print_version();
        return EXIT_SUCCESS;
    }

    if (auto conf = args.get(core::CONF_CONFFILE)) {
        auto loaded = args.parse_file(*conf);
        if (!loaded.ok()) return fail(loaded.error());
    }

    // Quiet by default; -loglevel / -debug override.
    if (!args.has(core::CONF_LOGLEVEL)) {
        args.set(core::CONF_LOGLEVEL, "warn");
    }
    auto logging = server::init_logging(server::LogSettings::from_config(args));
    if (!logging.ok()) return fail(logging.error());

    int rc = EXIT_FAILURE;
    try {
        if (args.has("keygen")) {
            rc = cmd_keygen();
        } else if (args.has("sign")) {
            rc = cmd_sign(args);
        } else if (args.has("verify")) {
            rc = cmd_verify(args);
        } else {
            print_usage();
        }
    } catch (const std::exception& e) {
        rc = fail(e.what());
    }

    core::Logger::instance().flush();
    return rc;
}

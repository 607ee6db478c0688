// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "content_hash.h"

#include <catch2/catch_all.hpp>

using namespace thumbgrid;

TEST_CASE("sha256_hex: known vectors", "[hash]") {
    REQUIRE(sha256_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
            "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("Sha256: incremental updates match one-shot", "[hash]") {
    const std::string text(1000, 'x');
    Sha256 h;
    h.update(text.substr(0, 63));
    h.update(text.substr(63, 1));
    h.update(text.substr(64));
    REQUIRE(Sha256::to_hex(h.finish()) == sha256_hex(text));

    h.reset();
    h.update(std::string("abc"));
    REQUIRE(Sha256::to_hex(h.finish()) == sha256_hex("abc"));
}

TEST_CASE("is_hex_identifier", "[hash]") {
    REQUIRE(is_hex_identifier("abc123abc123abc1"));
    REQUIRE(is_hex_identifier("ABCDEF0123456789"));
    REQUIRE(is_hex_identifier(sha256_hex("x")));
    REQUIRE_FALSE(is_hex_identifier("abc123"));             // too short
    REQUIRE_FALSE(is_hex_identifier("abc123abc123abc1g"));  // not hex
    REQUIRE_FALSE(is_hex_identifier("/path/to/image.png"));
    REQUIRE_FALSE(is_hex_identifier(std::string(129, 'a')));
}

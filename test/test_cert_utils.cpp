#include <array>

#include <doctest/doctest.h>

#include <certview/hash/algorithms.hpp>
#include <certview/utils/common.hpp>

using namespace certview;

TEST_SUITE("cert/utils") {
    TEST_CASE("hex encoding") {
        std::array<uint8_t, 3> data{0x00, 0xAB, 0x7F};
        CHECK(utils::to_hex(data) == "00ab7f");
        CHECK(utils::to_hex(data, true) == "00AB7F");
        CHECK(utils::to_colon_hex(data) == "00:ab:7f");
        CHECK(utils::to_hex(std::span<const uint8_t>{}).empty());
        CHECK(utils::to_colon_hex(std::span<const uint8_t>{}).empty());
    }

    TEST_CASE("hex decoding") {
        CHECK(utils::from_hex("00aB7f") == std::vector<uint8_t>{0x00, 0xAB, 0x7F});
        CHECK(utils::from_hex("abc").empty());
        CHECK(utils::from_hex("zz").empty());
        CHECK(utils::from_hex("").empty());
    }

    TEST_CASE("digests") {
        const std::string_view input = "abc";
        std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t *>(input.data()), input.size());

        auto sha256 = hash::digest(hash::Algorithm::SHA256, bytes);
        REQUIRE(sha256.success);
        CHECK(utils::to_hex(sha256.data) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        auto sha512 = hash::digest(hash::Algorithm::SHA512, bytes);
        REQUIRE(sha512.success);
        CHECK(utils::to_hex(sha512.data).rfind("ddaf35a193617aba", 0) == 0);

        auto blake = hash::digest(hash::Algorithm::BLAKE2b, bytes);
        REQUIRE(blake.success);
        CHECK(blake.data.size() == 32);

        CHECK(hash::algorithm_name(hash::Algorithm::SHA256) == "SHA-256");
    }
}

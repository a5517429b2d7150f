// Copyright (c) 2024 FoldChain
// Unit tests for Mersenne-prime field arithmetic

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>
#include <catch2/generators/catch_generators_random.hpp>
#include "crypto/field.hpp"
#include "crypto/sha256.hpp"
#include <array>

using namespace foldchain;
using namespace foldchain::crypto;

TEST_CASE("FieldElement - Construction and reduction", "[field]") {
    SECTION("Modulus is 2^31 - 1") {
        REQUIRE(FieldElement::MODULUS == 2147483647ULL);
    }

    SECTION("Values reduce into canonical range") {
        REQUIRE(FieldElement(0).Value() == 0);
        REQUIRE(FieldElement(FieldElement::MODULUS).Value() == 0);
        REQUIRE(FieldElement(FieldElement::MODULUS + 5).Value() == 5);
        REQUIRE(FieldElement(UINT64_MAX).Value() < FieldElement::MODULUS);
        // 2^64 - 1 = 2^62 * 4 - 1, and 2^31 == 1 (mod p)
        REQUIRE(FieldElement(UINT64_MAX).Value() == 3);
    }

    SECTION("FromCanonical rejects out-of-range values") {
        REQUIRE(FieldElement::FromCanonical(42).Value() == 42);
        REQUIRE_THROWS_AS(FieldElement::FromCanonical(FieldElement::MODULUS), FieldError);
        try {
            (void)FieldElement::FromCanonical(FieldElement::MODULUS + 1);
            FAIL("expected FieldError");
        } catch (const FieldError& e) {
            REQUIRE(e.code() == FieldError::Code::OutOfRange);
        }
    }
}

TEST_CASE("FieldElement - Arithmetic", "[field]") {
    const FieldElement p_minus_1(FieldElement::MODULUS - 1);

    SECTION("Addition wraps") {
        REQUIRE((p_minus_1 + FieldElement(1)).IsZero());
        REQUIRE((p_minus_1 + FieldElement(3)).Value() == 2);
    }

    SECTION("Subtraction wraps") {
        REQUIRE((FieldElement(0) - FieldElement(1)) == p_minus_1);
        REQUIRE((FieldElement(5) - FieldElement(7)).Value() == FieldElement::MODULUS - 2);
        REQUIRE((-FieldElement(0)).IsZero());
        REQUIRE((-FieldElement(1)) == p_minus_1);
    }

    SECTION("Multiplication reduces") {
        REQUIRE((p_minus_1 * p_minus_1).Value() == 1);
        REQUIRE((FieldElement(1u << 16) * FieldElement(1u << 16)).Value() == 2);
    }

    SECTION("Compound assignment") {
        FieldElement x(10);
        x += FieldElement(5);
        x *= FieldElement(2);
        x -= FieldElement(30);
        REQUIRE(x.IsZero());
    }
}

TEST_CASE("FieldElement - Inverse and exponentiation", "[field]") {
    SECTION("Pow") {
        REQUIRE(FieldElement(2).Pow(31).Value() == 1);
        REQUIRE(FieldElement(3).Pow(0).Value() == 1);
        REQUIRE(FieldElement(7).Pow(2).Value() == 49);
    }

    SECTION("Inverse of random elements") {
        auto raw = GENERATE(take(50, random<uint64_t>(1, FieldElement::MODULUS - 1)));
        const FieldElement x = FieldElement::FromCanonical(raw);
        REQUIRE((x * x.Inverse()).Value() == 1);
        REQUIRE((FieldElement(1) / x) == x.Inverse());
    }

    SECTION("Inverse of zero throws") {
        try {
            (void)FieldElement(0).Inverse();
            FAIL("expected FieldError");
        } catch (const FieldError& e) {
            REQUIRE(e.code() == FieldError::Code::ZeroInverse);
        }
        REQUIRE_THROWS_AS(FieldElement(4) / FieldElement(0), FieldError);
    }
}

TEST_CASE("FieldElement - Algebraic laws hold", "[field][property]") {
    auto a_raw = GENERATE(take(20, random<uint64_t>(0, FieldElement::MODULUS - 1)));
    auto b_raw = GENERATE(take(5, random<uint64_t>(0, FieldElement::MODULUS - 1)));
    const FieldElement a = FieldElement::FromCanonical(a_raw);
    const FieldElement b = FieldElement::FromCanonical(b_raw);
    const FieldElement c(977);

    REQUIRE(a + b == b + a);
    REQUIRE(a * b == b * a);
    REQUIRE((a + b) + c == a + (b + c));
    REQUIRE((a * b) * c == a * (b * c));
    REQUIRE(a * (b + c) == a * b + a * c);
    REQUIRE(a - a == FieldElement::Zero());
    REQUIRE(a + (-a) == FieldElement::Zero());
    REQUIRE((a * b).Value() < FieldElement::MODULUS);
}

TEST_CASE("FieldElement - Serialization", "[field]") {
    SECTION("Four bytes little-endian") {
        std::array<uint8_t, FieldElement::SERIALIZED_SIZE> buf{};
        FieldElement(0x01020304).Serialize(buf.data());
        REQUIRE(buf[0] == 0x04);
        REQUIRE(buf[1] == 0x03);
        REQUIRE(buf[2] == 0x02);
        REQUIRE(buf[3] == 0x01);
        REQUIRE(FieldElement::Deserialize(buf.data()).Value() == 0x01020304);
    }

    SECTION("Deserialize rejects non-canonical encodings") {
        const std::array<uint8_t, 4> bad = {0xff, 0xff, 0xff, 0x7f};
        REQUIRE_THROWS_AS(FieldElement::Deserialize(bad.data()), FieldError);
    }

    SECTION("FromHash is deterministic and canonical") {
        const std::string msg = "block";
        const uint256 h = Hash256(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(msg.data()), msg.size()));
        const FieldElement d1 = FieldElement::FromHash(h);
        const FieldElement d2 = FieldElement::FromHash(h);
        REQUIRE(d1 == d2);
        REQUIRE(d1.Value() < FieldElement::MODULUS);
        REQUIRE(FieldElement::FromHash(uint256()).IsZero());
    }
}

#include <catch2/catch.hpp>

#include <swarmkad/kademlia/address.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <numeric>
#include <unordered_set>

using namespace swarmkad;
using kademlia::Address;

using Array = std::array<byte_t, Address::SIZE>;

static constexpr auto seqHex = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"sv;

static Array seqArray()
{
    Array a;
    std::iota(a.begin(), a.end(), 0);
    return a;
}

TEST_CASE("Address from raw bytes", "[address]")
{
    const auto seq = seqArray();
    std::string raw{reinterpret_cast<const char*>(seq.data()), seq.size()};

    SECTION("exact length")
    {
        auto addr = Address::from_bytes(raw);
        REQUIRE(addr == Address{seq});
        REQUIRE(addr.ToHex() == seqHex);
    }

    SECTION("too short")
    {
        raw.pop_back();
        REQUIRE_THROWS_AS(Address::from_bytes(raw), kademlia::InvalidLength);
    }

    SECTION("too long")
    {
        raw.push_back('x');
        try
        {
            Address::from_bytes(raw);
            FAIL("expected InvalidLength");
        }
        catch (const kademlia::InvalidLength& e)
        {
            REQUIRE(e.expected == Address::SIZE);
            REQUIRE(e.actual == Address::SIZE + 1);
        }
    }

    SECTION("empty")
    {
        REQUIRE_THROWS_AS(Address::from_bytes(ustring_view{}), kademlia::InvalidLength);
    }
}

TEST_CASE("Address hex encoding", "[address]")
{
    const Address seq{seqArray()};

    SECTION("render is lowercase and 64 characters")
    {
        Address ff;
        ff.Fill(0xAB);
        std::string expected;
        for (size_t i = 0; i < Address::SIZE; ++i)
            expected += "ab";
        REQUIRE(ff.ToHex() == expected);
        REQUIRE(seq.ToHex() == seqHex);
        REQUIRE(seq.ToString() == seqHex);
        REQUIRE(seq.ShortHex() == "00010203");
    }

    SECTION("parse round trip")
    {
        REQUIRE(Address::from_hex(seq.ToHex()) == seq);

        Address zero;
        REQUIRE(Address::from_hex(zero.ToHex()) == zero);

        Address full;
        full.Fill(0xff);
        REQUIRE(Address::from_hex(full.ToHex()) == full);
    }

    SECTION("upper case input is accepted")
    {
        REQUIRE(Address::from_hex("000102030405060708090A0B0C0D0E0F101112131415161718191A1B1C1D1E1F") == seq);
    }

    SECTION("wrong length")
    {
        REQUIRE_THROWS_AS(Address::from_hex(""), kademlia::InvalidEncoding);
        REQUIRE_THROWS_AS(Address::from_hex(seqHex.substr(2)), kademlia::InvalidEncoding);
        REQUIRE_THROWS_AS(Address::from_hex(std::string{seqHex} + "00"), kademlia::InvalidEncoding);
    }

    SECTION("non hex character")
    {
        std::string bad{seqHex};
        bad[17] = 'g';
        REQUIRE_THROWS_AS(Address::from_hex(bad), kademlia::InvalidEncoding);
        bad[17] = ' ';
        REQUIRE_THROWS_AS(Address::from_hex(bad), kademlia::InvalidEncoding);
    }

    SECTION("encoding errors are invalid_argument")
    {
        REQUIRE_THROWS_AS(Address::from_hex("zz"), std::invalid_argument);
    }
}

TEST_CASE("Address binary rendering", "[address]")
{
    Address addr;
    addr[0] = 0xa5;
    addr[31] = 0x01;

    const auto bin = addr.ToBin();
    REQUIRE(bin.size() == Address::BITS);
    REQUIRE(bin.substr(0, 8) == "10100101");
    REQUIRE(bin.substr(8, 8) == "00000000");
    REQUIRE(bin.substr(248) == "00000001");
}

TEST_CASE("Address formatting", "[address]")
{
    const Address seq{seqArray()};
    REQUIRE(fmt::format("{}", seq) == seqHex);
}

TEST_CASE("Address JSON", "[address]")
{
    const Address seq{seqArray()};

    SECTION("encodes as a quoted hex string")
    {
        nlohmann::json j = seq;
        REQUIRE(j.is_string());
        REQUIRE(j.dump() == fmt::format("\"{}\"", seqHex));
    }

    SECTION("round trip inside an object")
    {
        nlohmann::json j;
        j["target"] = seq;
        auto parsed = nlohmann::json::parse(j.dump());
        REQUIRE(parsed["target"].get<Address>() == seq);
    }

    SECTION("rejects non string values")
    {
        REQUIRE_THROWS_AS(nlohmann::json(42).get<Address>(), kademlia::InvalidEncoding);
        REQUIRE_THROWS_AS(nlohmann::json::array().get<Address>(), kademlia::InvalidEncoding);
    }

    SECTION("rejects malformed strings")
    {
        REQUIRE_THROWS_AS(nlohmann::json("abc").get<Address>(), kademlia::InvalidEncoding);
    }
}

TEST_CASE("Address equality and hashing", "[address]")
{
    const Address seq{seqArray()};
    Address other{seq};
    REQUIRE(seq == other);

    other[31] ^= 0x01;
    REQUIRE(seq != other);

    std::unordered_set<Address> set{seq, other, Address{seqArray()}};
    REQUIRE(set.size() == 2);
    REQUIRE(set.count(seq) == 1);
}

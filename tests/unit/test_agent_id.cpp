#include <gtest/gtest.h>
#include <orbitguard/orbitguard.hpp>

#include <algorithm>
#include <unordered_map>
#include <vector>

using namespace orbitguard;

// ===========================================================================
// 1. Deterministic name-based UUIDs
// ===========================================================================

TEST(AgentIdTest, UuidIsVersion5InDnsNamespace) {
    AgentId a("astra-v3.0", "SAT-001-A");
    EXPECT_EQ(uuid_to_string(a.uuid()), "92c5db25-bd7c-5134-88fb-a364cb74558f");

    AgentId b("astra-v3.0", "SAT-002-B");
    EXPECT_EQ(uuid_to_string(b.uuid()), "75e032aa-4ec7-5088-9ffe-756faa23a6de");
}

TEST(AgentIdTest, UuidHexHasNoDashes) {
    AgentId a("astra-v3.0", "SAT-001-A");
    EXPECT_EQ(a.uuid_hex(), "92c5db25bd7c513488fba364cb74558f");
    EXPECT_EQ(a.uuid_hex().size(), 32u);
}

TEST(AgentIdTest, SameInputsGiveSameIdentity) {
    AgentId a("astra-v3.0", "SAT-007-C");
    auto b = AgentId::create("astra-v3.0", "SAT-007-C");

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.uuid(), b.uuid());
    EXPECT_NE(a, AgentId("astra-v3.0", "SAT-008-C"));
}

// ===========================================================================
// 2. Validation
// ===========================================================================

TEST(AgentIdTest, EmptySerialRejected) {
    EXPECT_THROW(AgentId("astra-v3.0", ""), InvalidAgentIdException);
}

TEST(AgentIdTest, UnsupportedConstellationRejected) {
    EXPECT_THROW(AgentId("astra-v2.0", "SAT-001-A"), InvalidAgentIdException);
    EXPECT_THROW(AgentId("", "SAT-001-A"), InvalidAgentIdException);
}

// ===========================================================================
// 3. Qualified names
// ===========================================================================

TEST(AgentIdTest, QualifiedNameRoundTrip) {
    AgentId a("astra-v3.0", "SAT-001-A");
    EXPECT_EQ(a.qualified_name(), "astra-v3.0:SAT-001-A");

    auto parsed = AgentId::parse(a.qualified_name());
    EXPECT_EQ(parsed, a);
    EXPECT_EQ(parsed.constellation(), "astra-v3.0");
    EXPECT_EQ(parsed.satellite_serial(), "SAT-001-A");
}

TEST(AgentIdTest, ParseRejectsMalformedNames) {
    EXPECT_THROW(AgentId::parse("SAT-001-A"), InvalidAgentIdException);
    EXPECT_THROW(AgentId::parse("astra-v3.0:"), InvalidAgentIdException);
    EXPECT_THROW(AgentId::parse("other:SAT-001-A"), InvalidAgentIdException);
}

// ===========================================================================
// 4. Usable as a map key and sortable by serial
// ===========================================================================

TEST(AgentIdTest, WorksAsHashMapKey) {
    std::unordered_map<AgentId, int> counts;
    counts[AgentId("astra-v3.0", "SAT-001-A")] = 1;
    counts[AgentId("astra-v3.0", "SAT-002-B")] = 2;
    counts[AgentId("astra-v3.0", "SAT-001-A")] += 10;

    EXPECT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts.at(AgentId("astra-v3.0", "SAT-001-A")), 11);
}

TEST(AgentIdTest, OrdersBySerial) {
    std::vector<AgentId> ids{
        AgentId("astra-v3.0", "SAT-003-C"),
        AgentId("astra-v3.0", "SAT-001-A"),
        AgentId("astra-v3.0", "SAT-002-B"),
    };
    std::sort(ids.begin(), ids.end());

    EXPECT_EQ(ids[0].satellite_serial(), "SAT-001-A");
    EXPECT_EQ(ids[1].satellite_serial(), "SAT-002-B");
    EXPECT_EQ(ids[2].satellite_serial(), "SAT-003-C");
}

// ===========================================================================
// 5. Crypto helpers underneath
// ===========================================================================

TEST(CryptoTest, HexDecodeAcceptsBothCases) {
    auto bytes = crypto::hex_decode("00ffAB10");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (Bytes{0x00, 0xFF, 0xAB, 0x10}));
    EXPECT_EQ(crypto::hex_encode(*bytes), "00ffab10");
}

TEST(CryptoTest, HexDecodeRejectsBadInput) {
    EXPECT_FALSE(crypto::hex_decode("abc").has_value());
    EXPECT_FALSE(crypto::hex_decode("zz").has_value());
}

TEST(CryptoTest, ConstantTimeEquals) {
    EXPECT_TRUE(crypto::constant_time_equals("abcd", "abcd"));
    EXPECT_FALSE(crypto::constant_time_equals("abcd", "abce"));
    EXPECT_FALSE(crypto::constant_time_equals("abcd", "abc"));
}

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <resolvit/common/encoding.hpp>
#include <resolvit/identity/did.hpp>

using namespace resolvit;

TEST_SUITE("DID Parsing Tests") {

    TEST_CASE("Parse sov DID") {
        auto result = DID::parse("did:sov:WgWxqztrNooG92RXvxSTWv");
        REQUIRE(result.is_ok());
        CHECK(result.value().getMethod() == "sov");
        CHECK(result.value().getNamespace().empty());
        CHECK(result.value().getNym() == "WgWxqztrNooG92RXvxSTWv");
        CHECK(result.value().toString() == "did:sov:WgWxqztrNooG92RXvxSTWv");
    }

    TEST_CASE("Parse namespaced DID") {
        auto result = DID::parse("did:indy:sovrin:staging:WgWxqztrNooG92RXvxSTWv");
        REQUIRE(result.is_ok());
        CHECK(result.value().getMethod() == "indy");
        CHECK(result.value().getNamespace() == "sovrin:staging");
        CHECK(result.value().getNym() == "WgWxqztrNooG92RXvxSTWv");
    }

    TEST_CASE("Parse DID with fragment and path") {
        auto frag = DID::parse("did:sov:WgWxqztrNooG92RXvxSTWv#key-1");
        REQUIRE(frag.is_ok());
        CHECK(frag.value().getNym() == "WgWxqztrNooG92RXvxSTWv");

        auto path = DID::parse("did:sov:WgWxqztrNooG92RXvxSTWv/some/path?x=1");
        REQUIRE(path.is_ok());
        CHECK(path.value().getNym() == "WgWxqztrNooG92RXvxSTWv");
    }

    TEST_CASE("Reject invalid DIDs") {
        CHECK(DID::parse("urn:sov:abc").is_err());
        CHECK(DID::parse("did:sov").is_err());
        CHECK(DID::parse("did::abc").is_err());
        CHECK(DID::parse("did:sov:").is_err());
    }

    TEST_CASE("DID from nym") {
        auto did = DID::fromNym("WgWxqztrNooG92RXvxSTWv");
        CHECK(did.toString() == "did:sov:WgWxqztrNooG92RXvxSTWv");
        CHECK(did == DID::parse("did:sov:WgWxqztrNooG92RXvxSTWv").value());
        CHECK_FALSE(did.isEmpty());
    }

    TEST_CASE("Bare nym extraction") {
        CHECK(toNym("did:sov:WgWxqztrNooG92RXvxSTWv") == "WgWxqztrNooG92RXvxSTWv");
        CHECK(toNym("WgWxqztrNooG92RXvxSTWv") == "WgWxqztrNooG92RXvxSTWv");
    }
}

TEST_SUITE("Ledger DID validation") {

    TEST_CASE("Qualified DIDs and bare nyms with base58 nyms are accepted") {
        CHECK(isLedgerDid("did:sov:WgWxqztrNooG92RXvxSTWv"));
        CHECK(isLedgerDid("did:indy:sovrin:WgWxqztrNooG92RXvxSTWv"));
        CHECK(isLedgerDid("WgWxqztrNooG92RXvxSTWv"));
    }

    TEST_CASE("Empty, non-base58 and non-UTF-8 identifiers are rejected") {
        CHECK_FALSE(isLedgerDid(""));
        CHECK_FALSE(isLedgerDid("did:sov:"));
        CHECK_FALSE(isLedgerDid("did:"));
        CHECK_FALSE(isLedgerDid("did:sov:0OIl"));
        CHECK_FALSE(isLedgerDid("did:sov:WgWxqztrNooG92RXvxST\xFF"));
        CHECK_FALSE(isLedgerDid("WgWxqztr NooG92"));
    }
}

TEST_SUITE("Identifier extraction") {

    TEST_CASE("Schema, credential definition and revocation registry ids") {
        CHECK(extractDIDFromIdentifier("WgWxqztrNooG92RXvxSTWv:2:schema_name:1.0") == "WgWxqztrNooG92RXvxSTWv");
        CHECK(extractDIDFromIdentifier("WgWxqztrNooG92RXvxSTWv:3:CL:20:tag") == "WgWxqztrNooG92RXvxSTWv");
        CHECK(extractDIDFromIdentifier(
                  "WgWxqztrNooG92RXvxSTWv:4:WgWxqztrNooG92RXvxSTWv:3:CL:20:tag:CL_ACCUM:0") ==
              "WgWxqztrNooG92RXvxSTWv");
    }

    TEST_CASE("Qualified DIDs") {
        CHECK(extractDIDFromIdentifier("did:sov:WgWxqztrNooG92RXvxSTWv") == "WgWxqztrNooG92RXvxSTWv");
        CHECK(extractDIDFromIdentifier("did:indy2:WgWxqztrNooG92RXvxSTWv") == "WgWxqztrNooG92RXvxSTWv");
        CHECK(extractDIDFromIdentifier("did:sov:WgWxqztrNooG92RXvxSTWv:2:schema:1.0") == "WgWxqztrNooG92RXvxSTWv");
    }

    TEST_CASE("Bare DID passes through") {
        CHECK(extractDIDFromIdentifier("WgWxqztrNooG92RXvxSTWv") == "WgWxqztrNooG92RXvxSTWv");
    }
}

TEST_SUITE("Self certification") {

    TEST_CASE("Abbreviated verkey is self-certified") {
        CHECK(isAbbreviatedVerkey("~CoRER63DVYnWZtK8uAzNbx"));
        CHECK(isSelfCertified("did:sov:WgWxqztrNooG92RXvxSTWv", "~CoRER63DVYnWZtK8uAzNbx"));
        CHECK_FALSE(isAbbreviatedVerkey("~short"));
        CHECK_FALSE(isAbbreviatedVerkey("CoRER63DVYnWZtK8uAzNbx"));
    }

    TEST_CASE("Full verkey whose prefix derives the nym") {
        std::vector<uint8_t> key(32);
        for (size_t i = 0; i < key.size(); ++i)
            key[i] = static_cast<uint8_t>(i * 11 + 3);
        std::vector<uint8_t> prefix(key.begin(), key.begin() + 16);
        std::string nym = encoding::base58Encode(prefix);
        std::string verkey = encoding::base58Encode(key);

        CHECK(isSelfCertified("did:sov:" + nym, verkey));
        CHECK(isSelfCertified(nym, verkey));

        key[0] ^= 0xFF;
        CHECK_FALSE(isSelfCertified("did:sov:" + nym, encoding::base58Encode(key)));
    }

    TEST_CASE("Missing or malformed verkey is not self-certified") {
        CHECK_FALSE(isSelfCertified("did:sov:WgWxqztrNooG92RXvxSTWv", ""));
        CHECK_FALSE(isSelfCertified("did:sov:WgWxqztrNooG92RXvxSTWv", "not-base58-0OIl"));
        CHECK_FALSE(isSelfCertified("did:sov:WgWxqztrNooG92RXvxSTWv", "3yZe7d"));
    }
}

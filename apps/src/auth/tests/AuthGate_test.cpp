#include "auth/AuthGate.h"
#include "auth/HmacProofVerifier.h"
#include <cctype>
#include <gtest/gtest.h>

using namespace StenoBridge;
using namespace StenoBridge::Auth;
using namespace std::chrono_literals;

namespace {

const std::vector<uint8_t> kKey(32, 0x42);

class AuthGateTest : public ::testing::Test {
protected:
    AuthGateTest()
        : gate_(
              AuthGateConfig{ .challengeTimeout = 10s,
                              .maxFailures = 3,
                              .failureWindow = 60s,
                              .lockout = 60s },
              std::make_shared<HmacProofVerifier>(kKey),
              AuthGate::Dependencies{ .now = [this]() { return now_; }, .randomBytes = {} })
    {}

    std::string proofFor(const Challenge& challenge)
    {
        auto proof = HmacProofVerifier::computeProof(kKey, challenge.nonce);
        EXPECT_TRUE(proof.isValue());
        return proof.value();
    }

    Challenge issue(const std::string& origin)
    {
        auto challenge = gate_.issueChallenge(origin);
        EXPECT_TRUE(challenge.isValue());
        return challenge.value();
    }

    Clock::time_point now_ = Clock::time_point{} + 1h;
    AuthGate gate_;
};

} // namespace

TEST_F(AuthGateTest, ValidProofAuthenticates)
{
    const auto challenge = issue("127.0.0.1");
    EXPECT_EQ(challenge.nonce.size(), AuthGate::kNonceBytes * 2);

    auto result = gate_.authenticate(challenge, proofFor(challenge), "127.0.0.1");
    ASSERT_TRUE(result.isValue()) << result.errorValue().message;
    EXPECT_EQ(result.value().origin, "127.0.0.1");
}

TEST_F(AuthGateTest, EveryChallengeHasAFreshNonce)
{
    const auto first = issue("127.0.0.1");
    const auto second = issue("127.0.0.1");
    EXPECT_NE(first.nonce, second.nonce);

    // A proof for one nonce does not answer another.
    auto replay = gate_.authenticate(second, proofFor(first), "127.0.0.1");
    ASSERT_TRUE(replay.isError());
    EXPECT_EQ(replay.errorValue().kind, AuthError::Kind::InvalidProof);
}

TEST_F(AuthGateTest, WrongKeyIsInvalidProof)
{
    const auto challenge = issue("10.0.0.5");
    auto wrong = HmacProofVerifier::computeProof(std::vector<uint8_t>(32, 0x01), challenge.nonce);
    ASSERT_TRUE(wrong.isValue());

    auto result = gate_.authenticate(challenge, wrong.value(), "10.0.0.5");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::InvalidProof);
}

TEST_F(AuthGateTest, GarbageProofIsInvalidProof)
{
    const auto challenge = issue("10.0.0.5");
    auto result = gate_.authenticate(challenge, std::string("not-hex!"), "10.0.0.5");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::InvalidProof);
}

TEST_F(AuthGateTest, MissingProofIsMissingCredential)
{
    const auto challenge = issue("10.0.0.5");
    auto result = gate_.authenticate(challenge, std::nullopt, "10.0.0.5");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::MissingCredential);

    auto empty = gate_.authenticate(issue("10.0.0.5"), std::string(), "10.0.0.5");
    ASSERT_TRUE(empty.isError());
    EXPECT_EQ(empty.errorValue().kind, AuthError::Kind::MissingCredential);
}

TEST_F(AuthGateTest, LateProofIsExpiredChallenge)
{
    const auto challenge = issue("127.0.0.1");
    now_ += 11s;

    auto result = gate_.authenticate(challenge, proofFor(challenge), "127.0.0.1");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::ExpiredChallenge);
}

TEST_F(AuthGateTest, RepeatedFailuresLockOutOnlyThatOrigin)
{
    for (int i = 0; i < 3; ++i) {
        const auto challenge = issue("10.0.0.9");
        EXPECT_TRUE(gate_.authenticate(challenge, std::string(64, '0'), "10.0.0.9").isError());
    }

    EXPECT_TRUE(gate_.isLockedOut("10.0.0.9"));
    auto refused = gate_.issueChallenge("10.0.0.9");
    ASSERT_TRUE(refused.isError());
    EXPECT_EQ(refused.errorValue().kind, AuthError::Kind::RateLimited);

    EXPECT_FALSE(gate_.isLockedOut("10.0.0.10"));
    EXPECT_TRUE(gate_.issueChallenge("10.0.0.10").isValue());

    now_ += 61s;
    EXPECT_FALSE(gate_.isLockedOut("10.0.0.9"));
    EXPECT_TRUE(gate_.issueChallenge("10.0.0.9").isValue());
}

TEST_F(AuthGateTest, FailuresOutsideWindowDoNotAccumulate)
{
    for (int i = 0; i < 5; ++i) {
        const auto challenge = issue("10.0.0.9");
        EXPECT_TRUE(gate_.authenticate(challenge, std::string(64, '0'), "10.0.0.9").isError());
        now_ += 31s;
    }
    EXPECT_FALSE(gate_.isLockedOut("10.0.0.9"));
}

TEST_F(AuthGateTest, ProofFromAnotherOriginIsRejected)
{
    const auto challenge = issue("10.0.0.1");
    auto result = gate_.authenticate(challenge, proofFor(challenge), "10.0.0.2");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::InvalidProof);
}

TEST(AuthGateRandomTest, RandomSourceFailureIsReported)
{
    AuthGate gate(
        AuthGateConfig{},
        std::make_shared<HmacProofVerifier>(kKey),
        AuthGate::Dependencies{ .now = {}, .randomBytes = [](std::vector<uint8_t>&) { return false; } });

    auto result = gate.issueChallenge("127.0.0.1");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::Internal);
}

TEST(HmacProofVerifierTest, MatchesKnownVector)
{
    // RFC 4231 test case 2.
    const std::string keyText = "Jefe";
    const std::vector<uint8_t> key(keyText.begin(), keyText.end());
    auto proof = HmacProofVerifier::computeProof(key, "what do ya want for nothing?");
    ASSERT_TRUE(proof.isValue());
    EXPECT_EQ(proof.value(), "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

    HmacProofVerifier verifier(key);
    EXPECT_TRUE(verifier.verify("what do ya want for nothing?", proof.value()));
    std::string upper = proof.value();
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    EXPECT_TRUE(verifier.verify("what do ya want for nothing?", upper));
    EXPECT_FALSE(verifier.verify("what do ya want for something?", proof.value()));
    EXPECT_FALSE(verifier.verify("what do ya want for nothing?", proof.value().substr(2)));
}

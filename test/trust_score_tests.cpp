#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <string>

#include <trust/verification_profile.hpp>

using openlink_relay::trust::trust_level;
using openlink_relay::trust::verification_level;
using openlink_relay::trust::verification_profile;

SCENARIO("Trust score grows with identity claims and is capped", "[trust][score]")
{
  GIVEN("An empty profile")
  {
    verification_profile profile;

    THEN("it scores 0 and is unverified")
    {
      CHECK(openlink_relay::trust::trust_score(profile) == 0);
      CHECK(openlink_relay::trust::trust_level_for(0) == trust_level::unverified);
    }

    WHEN("claims are added one at a time")
    {
      auto previous = openlink_relay::trust::trust_score(profile);
      auto never_decreases = true;
      const auto record = [&]() {
        const auto score = openlink_relay::trust::trust_score(profile);
        never_decreases = never_decreases and score >= previous;
        previous = score;
      };

      REQUIRE(openlink_relay::trust::set_mastodon(profile, "@alice@mastodon.social").success);
      record();
      CHECK(previous == 10);
      openlink_relay::trust::set_social_links(profile, { .twitter = "alice", .github = "alice", .website = {}, .email = {}, .pgp_key_id = {} });
      record();
      CHECK(previous == 25);
      openlink_relay::trust::set_organization(profile, "Studio Co", true);
      record();
      CHECK(previous == 45);
      profile.verified = true;
      profile.level = verification_level::trusted;
      record();
      profile.badges = { "early", "operator", "donor" };
      record();
      openlink_relay::trust::set_social_links(profile, { .twitter = {}, .github = {}, .website = "https://alice.example", .email = "a@alice.example", .pgp_key_id = "ABCD1234" });
      record();

      THEN("the score never decreases and stops at 100")
      {
        CHECK(never_decreases);
        CHECK(previous == openlink_relay::trust::max_trust_score);
        CHECK(openlink_relay::trust::trust_level_for(previous) == trust_level::highly_trusted);
      }
    }
  }

  GIVEN("Custom links")
  {
    verification_profile profile;
    REQUIRE(openlink_relay::trust::add_custom_link(profile, "Bandcamp", "https://alice.bandcamp.com", 1700000000000).success);

    THEN("unverified links add nothing, verified ones add 5")
    {
      CHECK(openlink_relay::trust::trust_score(profile) == 0);
      profile.custom_links.front().verified = true;
      CHECK(openlink_relay::trust::trust_score(profile) == 5);
    }

    THEN("a link without a name or URL is refused")
    {
      const auto result = openlink_relay::trust::add_custom_link(profile, "", "https://x.example", 0);
      CHECK_FALSE(result.success);
      CHECK(result.error == "Link name and URL are required");
      CHECK(profile.custom_links.size() == 1);
    }
  }
}

TEST_CASE("Score thresholds map to trust levels", "[trust][level]")
{
  CHECK(openlink_relay::trust::trust_level_for(19) == trust_level::unverified);
  CHECK(openlink_relay::trust::trust_level_for(20) == trust_level::basic);
  CHECK(openlink_relay::trust::trust_level_for(40) == trust_level::verified);
  CHECK(openlink_relay::trust::trust_level_for(60) == trust_level::trusted);
  CHECK(openlink_relay::trust::trust_level_for(79) == trust_level::trusted);
  CHECK(openlink_relay::trust::trust_level_for(80) == trust_level::highly_trusted);
  CHECK(openlink_relay::trust::label(trust_level::basic) == "Basic Verification");
  CHECK(openlink_relay::trust::to_string(trust_level::highly_trusted) == "highly-trusted");
}

SCENARIO("Mastodon handles are validated and linked", "[trust][mastodon]")
{
  verification_profile profile;

  WHEN("the handle is well formed")
  {
    REQUIRE(openlink_relay::trust::set_mastodon(profile, "@bob@fosstodon.org").success);

    THEN("the profile URL is derived from it")
    {
      CHECK(profile.mastodon_url == "https://fosstodon.org/@bob");
    }
  }

  WHEN("an explicit URL is given")
  {
    REQUIRE(openlink_relay::trust::set_mastodon(profile, "@bob@fosstodon.org", "https://social.example/bob").success);

    THEN("it is kept") { CHECK(profile.mastodon_url == "https://social.example/bob"); }
  }

  WHEN("the handle is malformed")
  {
    const auto missing_at = openlink_relay::trust::set_mastodon(profile, "bob@fosstodon.org");
    const auto missing_instance = openlink_relay::trust::set_mastodon(profile, "@bob");

    THEN("it is refused and the profile is untouched")
    {
      CHECK(missing_at.error == "Invalid Mastodon handle format. Use @user@instance.social");
      CHECK_FALSE(missing_instance.success);
      CHECK_FALSE(profile.mastodon.has_value());
    }
  }
}

SCENARIO("Verification links list proofs with derived URLs", "[trust][links]")
{
  GIVEN("A profile with several proofs")
  {
    verification_profile profile;
    REQUIRE(openlink_relay::trust::set_mastodon(profile, "@alice@mastodon.social").success);
    openlink_relay::trust::set_social_links(profile, { .twitter = "alice", .github = "alice-dev", .website = {}, .email = "a@alice.example", .pgp_key_id = {} });
    REQUIRE(openlink_relay::trust::add_custom_link(profile, "Blog", "https://blog.alice.example", 1).success);

    WHEN("listing them")
    {
      const auto links = openlink_relay::trust::verification_links(profile);

      THEN("they appear in display order")
      {
        REQUIRE(links.size() == 5);
        CHECK(links[0].type == "mastodon");
        CHECK(links[0].url == "https://mastodon.social/@alice");
        CHECK(links[1].type == "twitter");
        CHECK(links[1].label == "@alice");
        CHECK(links[1].url == "https://twitter.com/alice");
        CHECK(links[2].url == "https://github.com/alice-dev");
        CHECK(links[3].type == "email");
        CHECK_FALSE(links[3].url.has_value());
        CHECK(links[4].type == "custom");
        CHECK(links[4].verified == false);
      }
    }

    WHEN("the profile is persisted and read back")
    {
      const auto restored =
        openlink_relay::trust::verification_profile_from_json(openlink_relay::trust::to_json(profile));

      THEN("the score is unchanged")
      {
        CHECK(openlink_relay::trust::trust_score(restored) == openlink_relay::trust::trust_score(profile));
        CHECK(restored.custom_links.size() == 1);
        CHECK(restored.github == "alice-dev");
      }
    }
  }
}

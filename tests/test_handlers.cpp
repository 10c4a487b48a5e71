#include <gtest/gtest.h>
#include "handlers/admin_handler.hpp"
#include "handlers/fairness_handler.hpp"
#include "handlers/health_handler.hpp"
#include "http_session.hpp"
#include "connection_manager.hpp"
#include "memory_store.hpp"
#include "metrics.hpp"
#include "proof_codec.hpp"
#include "test_support.hpp"
#include <boost/json.hpp>

using namespace fairdraw;
using namespace fairdraw::testing_support;
namespace json = boost::json;

class HandlerTest : public ::testing::Test {
protected:
    static constexpr int64_t T0 = 1700000000;
    static constexpr int64_t CLOSE = T0 + 3600;

    void SetUp() override {
        MetricsRegistry::instance().reset();
        config.storage = StorageBackend::MEMORY;
        config.admin_token = "s3cret-admin-token";
        config.max_entries_per_draw = 100;
    }

    http::request<http::string_body> request(http::verb verb, const std::string& target,
                                             const std::string& body = "") {
        http::request<http::string_body> req{verb, target, 11};
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    static json::object body_of(const http::response<http::string_body>& res) {
        return json::parse(res.body()).as_object();
    }

    http::response<http::string_body> commit(const std::string& gid, int64_t close = CLOSE) {
        json::object body;
        body["giveaway_id"] = gid;
        body["entries_close_at"] = close;
        return admin.handle_commit(request(http::verb::post, "/v1/admin/commit", json::serialize(body)), "10.0.0.1");
    }

    http::response<http::string_body> draw(const std::string& gid, const std::vector<Entry>& entries) {
        json::object body;
        body["giveaway_id"] = gid;
        body["entries"] = codec::to_json(entries);
        return admin.handle_draw(request(http::verb::post, "/v1/admin/draw", json::serialize(body)), "10.0.0.1");
    }

    ServerConfig config;
    MemoryStore store;
    FixedRandomSource random{static_cast<unsigned char>(0x19)};
    ManualClock clock{T0};
    SeedCommitmentManager seeds{store, random, clock.fn()};
    WinnerSelector selector;
    ProofRecorder recorder{store, &store, DisclosureMode::FULL, clock.fn()};
    DrawCoordinator coordinator{store, seeds, selector, recorder, clock.fn()};
    ConnectionManager connections{"test_salt"};

    FairnessHandler fairness{config, seeds, recorder};
    AdminHandler admin{config, seeds, coordinator};
    HealthHandler health{config, connections, nullptr};
};

TEST(GiveawayTargetTest, ExtractsId) {
    EXPECT_EQ(giveaway_id_from_target("/v1/giveaways/g1/proof", "/v1/giveaways/", "/proof"), "g1");
    EXPECT_EQ(giveaway_id_from_target("/v1/giveaways/g1/proof?x=1", "/v1/giveaways/", "/proof"), "g1");
    EXPECT_FALSE(giveaway_id_from_target("/v1/giveaways//proof", "/v1/giveaways/", "/proof"));
    EXPECT_FALSE(giveaway_id_from_target("/v1/giveaways/a/b/proof", "/v1/giveaways/", "/proof"));
    EXPECT_FALSE(giveaway_id_from_target("/v1/giveaways/g1/commitment", "/v1/giveaways/", "/proof"));
    EXPECT_FALSE(giveaway_id_from_target("/v2/giveaways/g1/proof", "/v1/giveaways/", "/proof"));
}

TEST_F(HandlerTest, CommitThenPublicLookupHidesSeed) {
    auto res = commit("g1");
    EXPECT_EQ(res.result(), http::status::created);
    auto created = body_of(res);
    EXPECT_FALSE(created.contains("seed"));
    EXPECT_EQ(created["commitment"].as_string().size(), 64u);

    auto lookup = fairness.handle_commitment(request(http::verb::get, "/v1/giveaways/g1/commitment"), "g1", "10.0.0.2");
    EXPECT_EQ(lookup.result(), http::status::ok);
    auto published = body_of(lookup);
    EXPECT_FALSE(published.contains("seed"));
    EXPECT_EQ(published["commitment"], created["commitment"]);
    EXPECT_EQ(lookup[http::field::cache_control], "no-store");
}

TEST_F(HandlerTest, DuplicateCommitIsConflict) {
    commit("g1");
    auto res = commit("g1");
    EXPECT_EQ(res.result(), http::status::conflict);
    EXPECT_EQ(body_of(res)["error"].as_string(), "AlreadyCommitted");
}

TEST_F(HandlerTest, MalformedCommitIsBadRequest) {
    auto res = admin.handle_commit(request(http::verb::post, "/v1/admin/commit", "{\"giveaway_id\": \"g 1\"}"), "x");
    EXPECT_EQ(res.result(), http::status::bad_request);
    res = admin.handle_commit(request(http::verb::post, "/v1/admin/commit", "not json"), "x");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(HandlerTest, DrawLifecycleOverHttp) {
    commit("g1");
    auto entries = make_entries(10);

    auto early = draw("g1", entries);
    EXPECT_EQ(early.result(), http::status::conflict);
    EXPECT_EQ(body_of(early)["error"].as_string(), "PrematureReveal");

    clock.set(CLOSE);
    auto res = draw("g1", entries);
    ASSERT_EQ(res.result(), http::status::ok);
    auto proof = codec::proof_from_json(json::parse(res.body()));
    EXPECT_EQ(proof.total_entries, 10u);

    auto lookup = fairness.handle_commitment(request(http::verb::get, "/v1/giveaways/g1/commitment"), "g1", "x");
    EXPECT_EQ(body_of(lookup)["seed"].as_string(), proof.seed);

    auto stored = fairness.handle_proof(request(http::verb::get, "/v1/giveaways/g1/proof"), "g1", "x");
    EXPECT_EQ(stored.result(), http::status::ok);
    EXPECT_EQ(body_of(stored)["winner_entry_id"].as_string(), proof.winner_entry_id);

    auto state = admin.handle_state(request(http::verb::get, "/v1/admin/giveaways/g1/state"), "g1");
    EXPECT_EQ(body_of(state)["state"].as_string(), "proven");

    auto again = draw("g1", entries);
    EXPECT_EQ(again.result(), http::status::conflict);
    EXPECT_EQ(body_of(again)["error"].as_string(), "ProofAlreadyExists");
}

TEST_F(HandlerTest, DrawCannotBackdateEntryClose) {
    commit("g1");
    clock.set(T0 + 60);

    json::object body;
    body["giveaway_id"] = "g1";
    body["entries_close_at"] = 0;
    body["entries"] = codec::to_json(make_entries(3));
    auto res = admin.handle_draw(request(http::verb::post, "/v1/admin/draw", json::serialize(body)), "10.0.0.1");

    EXPECT_EQ(res.result(), http::status::conflict);
    EXPECT_EQ(body_of(res)["error"].as_string(), "PrematureReveal");
    EXPECT_FALSE(store.get_commitment("g1")->revealed);

    auto lookup = fairness.handle_commitment(request(http::verb::get, "/v1/giveaways/g1/commitment"), "g1", "x");
    EXPECT_FALSE(body_of(lookup).contains("seed"));
}

TEST_F(HandlerTest, DuplicateEntriesAreUnprocessable) {
    commit("g1");
    clock.set(CLOSE);
    auto entries = make_entries(3);
    entries[2].deterministic_input = entries[0].deterministic_input;
    auto res = draw("g1", entries);
    EXPECT_EQ(res.result(), http::status::unprocessable_entity);
    EXPECT_EQ(body_of(res)["error"].as_string(), "DuplicateEntryInput");
}

TEST_F(HandlerTest, OversizedDrawRejected) {
    commit("g1");
    clock.set(CLOSE);
    auto res = draw("g1", make_entries(101));
    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_FALSE(store.get_commitment("g1")->revealed);
}

TEST_F(HandlerTest, MissingRecordsAreNotFound) {
    auto res = fairness.handle_proof(request(http::verb::get, "/v1/giveaways/none/proof"), "none", "x");
    EXPECT_EQ(res.result(), http::status::not_found);
    res = fairness.handle_commitment(request(http::verb::get, "/v1/giveaways/none/commitment"), "none", "x");
    EXPECT_EQ(res.result(), http::status::not_found);
    res = fairness.handle_proof(request(http::verb::get, "/v1/giveaways/bad id/proof"), "bad id", "x");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(HandlerTest, VerifyEndpointReportsResult) {
    commit("g1");
    clock.set(CLOSE);
    auto entries = make_entries(6);
    auto drawn = draw("g1", entries);
    ASSERT_EQ(drawn.result(), http::status::ok);

    json::object body;
    body["proof"] = json::parse(drawn.body());
    body["entries"] = codec::to_json(entries);
    auto res = fairness.handle_verify(request(http::verb::post, "/v1/verify", json::serialize(body)), "x");
    ASSERT_EQ(res.result(), http::status::ok);
    auto result = body_of(res);
    EXPECT_TRUE(result["valid"].as_bool());
    EXPECT_EQ(result["mode"].as_string(), "strong");

    body["proof"].as_object()["commitment"] = std::string(64, '0');
    body.erase("entries");
    res = fairness.handle_verify(request(http::verb::post, "/v1/verify", json::serialize(body)), "x");
    ASSERT_EQ(res.result(), http::status::ok);
    result = body_of(res);
    EXPECT_FALSE(result["valid"].as_bool());
    EXPECT_EQ(result["mode"].as_string(), "weak");
    EXPECT_EQ(MetricsRegistry::instance().get_counter("verifications_invalid_total"), 1.0);
}

TEST_F(HandlerTest, VerifyRejectsMalformedBody) {
    auto res = fairness.handle_verify(request(http::verb::post, "/v1/verify", "{\"entries\": []}"), "x");
    EXPECT_EQ(res.result(), http::status::bad_request);
    res = fairness.handle_verify(request(http::verb::post, "/v1/verify", "[1,2"), "x");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(HandlerTest, AdminTokenCheck) {
    auto req = request(http::verb::post, "/v1/admin/commit");
    EXPECT_FALSE(health.verify_admin_request(req));

    req.set("X-Admin-Token", "wrong");
    EXPECT_FALSE(health.verify_admin_request(req));

    req.set("X-Admin-Token", "s3cret-admin-token");
    EXPECT_TRUE(health.verify_admin_request(req));

    config.admin_token.clear();
    EXPECT_FALSE(health.verify_admin_request(req));
}

TEST_F(HandlerTest, HealthOnMemoryBackend) {
    auto res = health.handle_health(11);
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = body_of(res);
    EXPECT_EQ(body["storage"].as_string(), "memory");
    EXPECT_EQ(body["selection_rule"].as_string(), "HMAC_SHA256_MAX_LEX");
}

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "provider/api_response_cache.hpp"
#include "provider/http_fetcher.hpp"
#include "provider/ynab_client.hpp"

namespace {

using budget::core::errors::BudgetError;
using budget::core::errors::ErrorCategory;
using budget::core::errors::get_error;
using budget::core::errors::get_value;
using budget::core::errors::is_error;
using budget::core::errors::Result;
using budget::provider::ApiResponseCache;
using budget::provider::HttpFetcher;
using budget::provider::HttpResponse;
using budget::provider::YnabClient;
using nlohmann::json;

// Scripted responses keyed by full URL; unknown URLs return 404.
class FakeFetcher : public HttpFetcher {
public:
    void script(const std::string& url, long status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[url] = HttpResponse{status, std::move(body)};
    }

    void fail(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[url] = true;
    }

    Result<HttpResponse> get(const std::string& url,
                             const std::vector<std::string>& headers) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        last_headers_ = headers;
        if (failures_.count(url) > 0) {
            return BudgetError{ErrorCategory::Provider, "connection refused",
                               "http_transport_failed"};
        }
        auto it = responses_.find(url);
        if (it == responses_.end()) {
            return HttpResponse{404, "{}"};
        }
        return it->second;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::string> last_headers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_headers_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, HttpResponse> responses_;
    std::map<std::string, bool> failures_;
    mutable int calls_ = 0;
    mutable std::vector<std::string> last_headers_;
};

constexpr const char* kBase = "https://api.test/v1";

class YnabClientTest : public ::testing::Test {
protected:
    YnabClientTest() : fetcher_(std::make_shared<FakeFetcher>()) {}

    YnabClient make_client(const std::string& token = "secret") const {
        return YnabClient(token, fetcher_, std::string(kBase) + "/");
    }

    std::shared_ptr<FakeFetcher> fetcher_;
};

TEST_F(YnabClientTest, StripsTrailingSlashFromBaseUrl) {
    EXPECT_EQ(make_client().base_url(), kBase);
}

TEST_F(YnabClientTest, BlankTokenFailsWithoutNetwork) {
    auto client = make_client("  ");
    auto result = client.get_budgets();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Provider);
    EXPECT_EQ(get_error(result).code, "invalid_api_token");
    EXPECT_EQ(fetcher_->calls(), 0);
}

TEST_F(YnabClientTest, SendsBearerTokenAndParsesBody) {
    fetcher_->script(std::string(kBase) + "/budgets", 200, R"({"data":{"budgets":[]}})");
    auto client = make_client();
    auto result = client.get_budgets();
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result)["data"]["budgets"].is_array());
    EXPECT_EQ(fetcher_->last_headers(),
              (std::vector<std::string>{"Authorization: Bearer secret"}));
}

TEST_F(YnabClientTest, SecondCallIsServedFromCache) {
    fetcher_->script(std::string(kBase) + "/budgets", 200, R"({"data":{}})");
    auto client = make_client();
    ASSERT_FALSE(is_error(client.get_budgets()));
    ASSERT_FALSE(is_error(client.get_budgets()));
    EXPECT_EQ(fetcher_->calls(), 1);
    EXPECT_EQ(client.cache_size(), 1u);

    client.clear_cache();
    ASSERT_FALSE(is_error(client.get_budgets()));
    EXPECT_EQ(fetcher_->calls(), 2);
}

TEST_F(YnabClientTest, CleanupCacheEvictsOnlyExpiredResponses) {
    auto now = ApiResponseCache::Clock::now();
    auto cache = std::make_shared<ApiResponseCache>(std::chrono::seconds(30),
                                                    [&now] { return now; });
    YnabClient client("secret", fetcher_, kBase, cache);
    fetcher_->script(std::string(kBase) + "/budgets", 200, R"({"data":{}})");
    fetcher_->script(std::string(kBase) + "/budgets/b-1", 200, R"({"data":{}})");

    ASSERT_FALSE(is_error(client.get_budgets()));
    now += std::chrono::seconds(20);
    ASSERT_FALSE(is_error(client.get_budget("b-1")));
    EXPECT_EQ(client.cache_size(), 2u);

    now += std::chrono::seconds(15);
    EXPECT_EQ(client.cleanup_cache(), 1u);
    EXPECT_EQ(client.cache_size(), 1u);

    ASSERT_FALSE(is_error(client.get_budget("b-1")));
    EXPECT_EQ(fetcher_->calls(), 2);
}

TEST_F(YnabClientTest, UnauthorizedIsInvalidToken) {
    fetcher_->script(std::string(kBase) + "/budgets", 401, "{}");
    auto client = make_client();
    auto result = client.get_budgets();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_api_token");
}

TEST_F(YnabClientTest, ErrorStatusIsNotCached) {
    auto client = make_client();
    auto result = client.get_budget("b1");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "http_status");
    EXPECT_EQ(client.cache_size(), 0u);
}

TEST_F(YnabClientTest, NonJsonBodyIsProviderError) {
    fetcher_->script(std::string(kBase) + "/budgets", 200, "<html>");
    auto client = make_client();
    auto result = client.get_budgets();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_response_json");
}

TEST_F(YnabClientTest, RejectsUnsafeBudgetIds) {
    auto client = make_client();
    for (const std::string id : {"", "  ", "a/b"}) {
        auto result = client.get_transactions(id);
        ASSERT_TRUE(is_error(result)) << id;
        EXPECT_EQ(get_error(result).code, "invalid_budget_id");
    }
    EXPECT_EQ(fetcher_->calls(), 0);
}

TEST_F(YnabClientTest, BatchKeepsInputOrderAndIsolatesFailures) {
    fetcher_->script(std::string(kBase) + "/a", 200, R"({"n":1})");
    fetcher_->fail(std::string(kBase) + "/b");
    fetcher_->script(std::string(kBase) + "/c", 200, R"({"n":3})");

    auto client = make_client();
    auto results = client.batch({"/a", "/b", "/c"});
    ASSERT_EQ(results.size(), 3u);
    ASSERT_FALSE(is_error(results[0]));
    EXPECT_EQ(get_value(results[0])["n"], 1);
    ASSERT_TRUE(is_error(results[1]));
    EXPECT_EQ(get_error(results[1]).code, "http_transport_failed");
    ASSERT_FALSE(is_error(results[2]));
    EXPECT_EQ(get_value(results[2])["n"], 3);
}

TEST_F(YnabClientTest, BudgetBatchFetchesThreeResources) {
    const std::string budget = std::string(kBase) + "/budgets/b1";
    fetcher_->script(budget, 200, R"({"data":{"budget":{"id":"b1","name":"Home"}}})");
    fetcher_->script(budget + "/categories", 200, R"({"data":{"category_groups":[]}})");
    fetcher_->script(budget + "/transactions", 200, R"({"data":{"transactions":[]}})");

    auto client = make_client();
    auto batch = client.get_budget_batch("b1");
    ASSERT_FALSE(is_error(batch.budget));
    ASSERT_FALSE(is_error(batch.categories));
    ASSERT_FALSE(is_error(batch.transactions));
    EXPECT_EQ(get_value(batch.budget)["data"]["budget"]["name"], "Home");
    EXPECT_EQ(fetcher_->calls(), 3);
}

TEST_F(YnabClientTest, BudgetBatchWithBadIdFailsEverySlot) {
    auto client = make_client();
    auto batch = client.get_budget_batch("");
    EXPECT_TRUE(is_error(batch.budget));
    EXPECT_TRUE(is_error(batch.categories));
    EXPECT_TRUE(is_error(batch.transactions));
    EXPECT_EQ(fetcher_->calls(), 0);
}

}  // namespace

#include <gtest/gtest.h>

#include "adapters/secondary/persistence/InMemoryNavRepository.hpp"
#include "adapters/secondary/persistence/InMemoryProductRepository.hpp"
#include "adapters/secondary/pricing/NavPricingProvider.hpp"
#include "domain/LedgerErrors.hpp"

using namespace corebank;
using namespace corebank::domain;
using namespace corebank::adapters::secondary;
using corebank::settings::PricingSettings;

class NavPricingProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        navs_ = std::make_shared<InMemoryNavRepository>();
    }

    std::shared_ptr<NavPricingProvider> providerWithDefault(const std::optional<Decimal>& price) {
        return std::make_shared<NavPricingProvider>(
            navs_, std::make_shared<PricingSettings>(PricingSettings::withDefaultPrice(price)));
    }

    std::shared_ptr<InMemoryNavRepository> navs_;
};

TEST_F(NavPricingProviderTest, LatestNavWins) {
    navs_->save(NavRecord{"fund", "2025-12-15", Decimal::parse("1.10")});
    navs_->save(NavRecord{"fund", "2025-12-17", Decimal::parse("1.30")});
    navs_->save(NavRecord{"fund", "2025-12-16", Decimal::parse("1.20")});

    auto provider = providerWithDefault(Decimal::fromInt(1));

    EXPECT_EQ(provider->getCurrentUnitPrice("fund")->toString(), "1.3000");
}

TEST_F(NavPricingProviderTest, SameDateOverwrites) {
    navs_->save(NavRecord{"fund", "2025-12-16", Decimal::parse("1.20")});
    navs_->save(NavRecord{"fund", "2025-12-16", Decimal::parse("1.25")});

    auto history = navs_->findHistory("fund", 10);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].unitPrice.toString(), "1.2500");
}

TEST_F(NavPricingProviderTest, HistoryNewestFirstAndLimited) {
    navs_->save(NavRecord{"fund", "2025-12-15", Decimal::parse("1.10")});
    navs_->save(NavRecord{"fund", "2025-12-16", Decimal::parse("1.20")});
    navs_->save(NavRecord{"fund", "2025-12-17", Decimal::parse("1.30")});

    auto history = navs_->findHistory("fund", 2);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].date, "2025-12-17");
    EXPECT_EQ(history[1].date, "2025-12-16");
}

TEST_F(NavPricingProviderTest, FallsBackToDefaultPrice) {
    auto provider = providerWithDefault(Decimal::fromInt(1));
    EXPECT_EQ(provider->getCurrentUnitPrice("unknown")->toString(), "1.0000");
}

TEST_F(NavPricingProviderTest, NoDefaultMeansNoPrice) {
    auto provider = providerWithDefault(std::nullopt);
    EXPECT_FALSE(provider->getCurrentUnitPrice("unknown").has_value());
}

TEST(InMemoryProductRepositoryTest, CodesAreUnique) {
    InMemoryProductRepository repository;

    InvestmentProduct product;
    product.id = "p-1";
    product.code = "MMF01";
    repository.save(product);

    product.name = "renamed";
    EXPECT_NO_THROW(repository.save(product));
    EXPECT_EQ(repository.findByCode("MMF01")->name, "renamed");

    product.id = "p-2";
    EXPECT_THROW(repository.save(product), BusinessRuleException);
}

TEST(InMemoryProductRepositoryTest, FindActiveSortedByRisk) {
    InMemoryProductRepository repository;

    InvestmentProduct risky;
    risky.id = "p-1";
    risky.code = "B";
    risky.riskLevel = 4;
    repository.save(risky);

    InvestmentProduct safe;
    safe.id = "p-2";
    safe.code = "A";
    safe.riskLevel = 1;
    repository.save(safe);

    InvestmentProduct closed;
    closed.id = "p-3";
    closed.code = "C";
    closed.active = false;
    repository.save(closed);

    auto active = repository.findActive();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].code, "A");
    EXPECT_EQ(active[1].code, "B");
}

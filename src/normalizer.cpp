#include "normalizer.hpp"
#include "fallback.hpp"
#include "logger.hpp"
#include <cmath>

namespace fairvalue {

namespace {

std::optional<double> absolute(std::optional<double> value) {
    if (!value) {
        return std::nullopt;
    }
    return std::fabs(*value);
}

std::optional<double> negate(std::optional<double> value) {
    if (!value) {
        return std::nullopt;
    }
    return -*value;
}

// ============================================================================
// Market data and unit reconciliation
// ============================================================================

void derive_share_count(NormalizedMetrics& m) {
    m.set_if_missing(metric::SHARES_OUTSTANDING, first_available({
        [&] { return safe_divide(positive(m.get(metric::MARKET_CAP)),
                                 positive(m.get(metric::CURRENT_PRICE))); }
    }));
}

void reconcile_share_units(NormalizedMetrics& m, const ValuationContext& ctx) {
    auto shares = m.get(metric::SHARES_OUTSTANDING);
    if (!shares || *shares <= SHARES_IMPLAUSIBILITY_THRESHOLD) {
        return;
    }

    double rescaled = *shares;
    while (rescaled > SHARES_IMPLAUSIBILITY_THRESHOLD) {
        rescaled /= SHARES_RESCALE_FACTOR;
    }
    m.rescale(metric::SHARES_OUTSTANDING, rescaled);
    Logger::get_instance().log_unit_rescaled(ctx, metric::SHARES_OUTSTANDING, *shares, rescaled);
}

// ============================================================================
// Statement-level derivations
// ============================================================================

void derive_balance_sheet(NormalizedMetrics& m) {
    m.set_if_missing(metric::TOTAL_EQUITY, first_available({
        [&] { return subtract(m.get(metric::TOTAL_ASSETS), m.get(metric::TOTAL_LIABILITIES)); }
    }));

    m.set_if_missing(metric::TOTAL_DEBT, first_available({
        [&] { return sum_present({m.get(metric::SHORT_TERM_DEBT), m.get(metric::LONG_TERM_DEBT)}); },
        [&] { return m.get(metric::TOTAL_LIABILITIES); }
    }));
}

void derive_operating_profit(NormalizedMetrics& m) {
    // Expenses keep their statement sign (negative), so they are added
    m.set_if_missing(metric::EBIT, first_available({
        [&] { return add(m.get(metric::GROSS_PROFIT),
                         sum_present({m.get(metric::SELLING_EXPENSES),
                                      m.get(metric::ADMIN_EXPENSES)})); }
    }));

    m.set_if_missing(metric::EBITDA, first_available({
        [&] { return add(m.get(metric::EBIT), m.get(metric::DEPRECIATION)); },
        [&] { return add(add(m.get(metric::NET_INCOME), absolute(m.get(metric::INCOME_TAX))),
                         add(absolute(m.get(metric::INTEREST_EXPENSE)),
                             m.get(metric::DEPRECIATION))); }
    }));
}

void derive_cash_flow_composites(NormalizedMetrics& m) {
    m.set_if_missing(metric::NON_CASH_CHARGES,
        sum_present({m.get(metric::DEPRECIATION), m.get(metric::PROVISIONS)}));

    m.set_if_missing(metric::NET_BORROWING,
        sum_present({m.get(metric::BORROWING_PROCEEDS), m.get(metric::DEBT_REPAYMENTS)}));

    m.set_if_missing(metric::FIXED_CAPITAL_INVESTMENT,
        sum_present({m.get(metric::CAPITAL_EXPENDITURE), m.get(metric::ASSET_DISPOSAL_PROCEEDS)}));

    // Cash-flow statement changes are cash effects; the working-capital
    // increase is their negation
    m.set_if_missing(metric::WORKING_CAPITAL_CHANGE,
        negate(sum_present({m.get(metric::RECEIVABLES_CHANGE),
                            m.get(metric::INVENTORIES_CHANGE),
                            m.get(metric::PAYABLES_CHANGE),
                            m.get(metric::PREPAID_EXPENSES_CHANGE)})));
}

// ============================================================================
// Ratios
// ============================================================================

void derive_margins_and_returns(NormalizedMetrics& m) {
    auto revenue = m.get(metric::REVENUE);
    auto net_income = m.get(metric::NET_INCOME);

    m.set_if_missing(metric::GROSS_MARGIN, safe_divide(m.get(metric::GROSS_PROFIT), revenue));
    m.set_if_missing(metric::EBIT_MARGIN, safe_divide(m.get(metric::EBIT), revenue));
    m.set_if_missing(metric::NET_PROFIT_MARGIN, safe_divide(net_income, revenue));

    m.set_if_missing(metric::ROA, safe_divide(net_income, m.get(metric::TOTAL_ASSETS)));
    m.set_if_missing(metric::ROE, safe_divide(net_income, m.get(metric::TOTAL_EQUITY)));
}

void derive_efficiency(NormalizedMetrics& m) {
    auto revenue = m.get(metric::REVENUE);

    m.set_if_missing(metric::ASSET_TURNOVER, safe_divide(revenue, m.get(metric::TOTAL_ASSETS)));

    m.set_if_missing(metric::INVENTORY_TURNOVER, safe_divide(revenue, m.get(metric::INVENTORY)));
    m.set_if_missing(metric::FIXED_ASSET_TURNOVER, safe_divide(revenue, m.get(metric::FIXED_ASSETS)));
    m.set_if_missing(metric::RECEIVABLES_TURNOVER,
                     safe_divide(revenue, m.get(metric::ACCOUNTS_RECEIVABLE)));
}

void derive_liquidity(NormalizedMetrics& m) {
    auto current_liabilities = m.get(metric::CURRENT_LIABILITIES);
    auto current_assets = m.get(metric::CURRENT_ASSETS);

    m.set_if_missing(metric::CURRENT_RATIO, safe_divide(current_assets, current_liabilities));
    m.set_if_missing(metric::QUICK_RATIO,
        safe_divide(subtract(current_assets, m.get(metric::INVENTORY)), current_liabilities));
    m.set_if_missing(metric::CASH_RATIO, safe_divide(m.get(metric::CASH), current_liabilities));
}

void derive_leverage(NormalizedMetrics& m) {
    m.set_if_missing(metric::DEBT_TO_EQUITY,
                     safe_divide(m.get(metric::TOTAL_DEBT), m.get(metric::TOTAL_EQUITY)));

    // equity_multiplier and financial_leverage name the same ratio
    m.set_if_missing(metric::EQUITY_MULTIPLIER, first_available({
        [&] { return m.get(metric::FINANCIAL_LEVERAGE); },
        [&] { return safe_divide(m.get(metric::TOTAL_ASSETS), m.get(metric::TOTAL_EQUITY)); }
    }));
    m.set_if_missing(metric::FINANCIAL_LEVERAGE, m.get(metric::EQUITY_MULTIPLIER));
}

void derive_per_share(NormalizedMetrics& m) {
    auto shares = m.get(metric::SHARES_OUTSTANDING);
    auto price = m.get(metric::CURRENT_PRICE);

    m.set_if_missing(metric::EPS, safe_divide(m.get(metric::NET_INCOME), shares));
    m.set_if_missing(metric::BOOK_VALUE_PER_SHARE, safe_divide(m.get(metric::TOTAL_EQUITY), shares));
    m.set_if_missing(metric::MARKET_CAP, multiply(price, shares));

    m.set_if_missing(metric::PE_RATIO, safe_divide(price, positive(m.get(metric::EPS))));
    m.set_if_missing(metric::PB_RATIO, safe_divide(price, positive(m.get(metric::BOOK_VALUE_PER_SHARE))));
    m.set_if_missing(metric::PS_RATIO, safe_divide(m.get(metric::MARKET_CAP), m.get(metric::REVENUE)));
}

void derive_coverage_and_enterprise_value(NormalizedMetrics& m) {
    m.set_if_missing(metric::INTEREST_COVERAGE,
                     safe_divide(m.get(metric::EBIT), absolute(m.get(metric::INTEREST_EXPENSE))));

    m.set_if_missing(metric::ENTERPRISE_VALUE,
        subtract(add(m.get(metric::MARKET_CAP), m.get(metric::TOTAL_DEBT)), m.get(metric::CASH)));

    m.set_if_missing(metric::EV_TO_EBITDA,
        safe_divide(m.get(metric::ENTERPRISE_VALUE), positive(m.get(metric::EBITDA))));
}

} // anonymous namespace

NormalizedMetrics normalize(const NormalizedMetrics& metrics, const std::string& symbol) {
    NormalizedMetrics m = metrics;
    ValuationContext ctx(symbol, "normalize");

    // Share count first: every per-share figure depends on it
    derive_share_count(m);
    reconcile_share_units(m, ctx);

    derive_balance_sheet(m);
    derive_operating_profit(m);
    derive_cash_flow_composites(m);
    derive_margins_and_returns(m);
    derive_efficiency(m);
    derive_liquidity(m);
    derive_leverage(m);
    derive_per_share(m);
    derive_coverage_and_enterprise_value(m);

    return m;
}

} // namespace fairvalue

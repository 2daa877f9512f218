#ifndef FAIRVALUE_METRICS_HPP
#define FAIRVALUE_METRICS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fairvalue {

// Canonical metric names shared by extraction, normalization and the models
namespace metric {

// Income statement (flow)
constexpr const char* REVENUE = "revenue_ttm";
constexpr const char* GROSS_PROFIT = "gross_profit";
constexpr const char* SELLING_EXPENSES = "selling_expenses";
constexpr const char* ADMIN_EXPENSES = "admin_expenses";
constexpr const char* EBIT = "ebit";
constexpr const char* EBITDA = "ebitda";
constexpr const char* INTEREST_EXPENSE = "interest_expense";
constexpr const char* INCOME_TAX = "income_tax";
constexpr const char* NET_INCOME = "net_income_ttm";

// Balance sheet (stock)
constexpr const char* TOTAL_ASSETS = "total_assets";
constexpr const char* TOTAL_LIABILITIES = "total_liabilities";
constexpr const char* TOTAL_EQUITY = "total_equity";
constexpr const char* SHORT_TERM_DEBT = "short_term_debt";
constexpr const char* LONG_TERM_DEBT = "long_term_debt";
constexpr const char* TOTAL_DEBT = "total_debt";
constexpr const char* CASH = "cash";
constexpr const char* CURRENT_ASSETS = "current_assets";
constexpr const char* CURRENT_LIABILITIES = "current_liabilities";
constexpr const char* INVENTORY = "inventory";
constexpr const char* ACCOUNTS_RECEIVABLE = "accounts_receivable";
constexpr const char* FIXED_ASSETS = "fixed_assets";

// Cash flow statement (flow, statement sign: outflows negative)
constexpr const char* DEPRECIATION = "depreciation";
constexpr const char* PROVISIONS = "provisions";
constexpr const char* OPERATING_CASH_FLOW = "operating_cash_flow";
constexpr const char* CAPITAL_EXPENDITURE = "capital_expenditure";
constexpr const char* ASSET_DISPOSAL_PROCEEDS = "asset_disposal_proceeds";
constexpr const char* BORROWING_PROCEEDS = "borrowing_proceeds";
constexpr const char* DEBT_REPAYMENTS = "debt_repayments";
constexpr const char* RECEIVABLES_CHANGE = "receivables_change";
constexpr const char* INVENTORIES_CHANGE = "inventories_change";
constexpr const char* PAYABLES_CHANGE = "payables_change";
constexpr const char* PREPAID_EXPENSES_CHANGE = "prepaid_expenses_change";

// Cash-flow composites used by the DCF models
constexpr const char* NON_CASH_CHARGES = "non_cash_charges";
constexpr const char* NET_BORROWING = "net_borrowing";
constexpr const char* FIXED_CAPITAL_INVESTMENT = "fixed_capital_investment";
constexpr const char* WORKING_CAPITAL_CHANGE = "working_capital_change";

// Market data
constexpr const char* CURRENT_PRICE = "current_price";
constexpr const char* SHARES_OUTSTANDING = "shares_outstanding";
constexpr const char* DIVIDEND_PER_SHARE = "dividend_per_share";

// Ratios (raw fractions for margins and returns)
constexpr const char* GROSS_MARGIN = "gross_margin";
constexpr const char* EBIT_MARGIN = "ebit_margin";
constexpr const char* NET_PROFIT_MARGIN = "net_profit_margin";
constexpr const char* ROA = "roa";
constexpr const char* ROE = "roe";
constexpr const char* ASSET_TURNOVER = "asset_turnover";
constexpr const char* INVENTORY_TURNOVER = "inventory_turnover";
constexpr const char* FIXED_ASSET_TURNOVER = "fixed_asset_turnover";
constexpr const char* RECEIVABLES_TURNOVER = "receivables_turnover";
constexpr const char* CURRENT_RATIO = "current_ratio";
constexpr const char* QUICK_RATIO = "quick_ratio";
constexpr const char* CASH_RATIO = "cash_ratio";
constexpr const char* DEBT_TO_EQUITY = "debt_to_equity";
constexpr const char* EQUITY_MULTIPLIER = "equity_multiplier";
constexpr const char* FINANCIAL_LEVERAGE = "financial_leverage";
constexpr const char* EPS = "eps";
constexpr const char* BOOK_VALUE_PER_SHARE = "book_value_per_share";
constexpr const char* MARKET_CAP = "market_cap";
constexpr const char* PE_RATIO = "pe_ratio";
constexpr const char* PB_RATIO = "pb_ratio";
constexpr const char* PS_RATIO = "ps_ratio";
constexpr const char* INTEREST_COVERAGE = "interest_coverage";
constexpr const char* ENTERPRISE_VALUE = "enterprise_value";
constexpr const char* EV_TO_EBITDA = "ev_to_ebitda";

} // namespace metric

// Where a metric value came from. Lower values are more reliable.
enum class MetricSource : uint8_t {
    Extracted = 0,  // Read directly from statement or market data
    Derived = 1,    // Computed from other metrics
    Default = 2     // Documented default
};

std::string metric_source_to_string(MetricSource source);

// NormalizedMetrics: canonical metric name -> nullable value.
// An absent name means "unavailable"; zero is a real value.
// A present value is never replaced by set_if_missing(), so the first
// (most reliable) source to supply a metric wins.
class NormalizedMetrics {
public:
    struct Entry {
        double value;
        MetricSource source;

        bool operator==(const Entry& other) const {
            return value == other.value && source == other.source;
        }
    };

    NormalizedMetrics() = default;

    std::optional<double> get(const std::string& name) const;
    bool has(const std::string& name) const;
    double value_or(const std::string& name, double fallback) const;
    std::optional<MetricSource> source(const std::string& name) const;

    // Store `value` under `name` unless a value is already present.
    // nullopt and non-finite values are ignored. Returns true if stored.
    bool set_if_missing(const std::string& name, std::optional<double> value,
                        MetricSource source = MetricSource::Derived);

    // Replace an existing value in place, keeping its source. Used for unit
    // reconciliation, never for derivation. Throws std::out_of_range if absent
    // and std::invalid_argument if `value` is not finite.
    void rescale(const std::string& name, double value);

    void erase(const std::string& name);

    const std::map<std::string, Entry>& entries() const { return entries_; }
    std::vector<std::string> names() const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool operator==(const NormalizedMetrics& other) const { return entries_ == other.entries_; }
    bool operator!=(const NormalizedMetrics& other) const { return !(*this == other); }

private:
    std::map<std::string, Entry> entries_;
};

} // namespace fairvalue

#endif // FAIRVALUE_METRICS_HPP
